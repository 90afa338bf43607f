/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace palsav::gvas {
using Bytes = std::vector<std::uint8_t>;

/**
 * 16-byte identifier. `bytes` holds the canonical (display) order, i.e. the
 * order in which the hex digits of "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
 * appear. On the wire each 32-bit word is stored little-endian.
 */
struct Guid {
    std::array<std::uint8_t, 16> bytes{};

    static Guid from_wire(std::span<const std::uint8_t> wire);
    static Guid parse(std::string_view text);
    static std::optional<Guid> try_parse(std::string_view text);

    std::array<std::uint8_t, 16> to_wire() const;
    std::string to_string() const;
    bool is_zero() const;

    bool operator==(const Guid&) const = default;
};

bool is_ascii(std::string_view s);
std::string latin1_to_utf8(std::span<const std::uint8_t> bytes);
std::string utf16le_to_utf8(std::span<const std::uint8_t> bytes);
std::u16string utf8_to_utf16(std::string_view s);

std::string base64_encode(std::span<const std::uint8_t> data);
Bytes base64_decode(std::string_view text);

std::string to_hex(std::span<const std::uint8_t> bytes);
}  // namespace palsav::gvas

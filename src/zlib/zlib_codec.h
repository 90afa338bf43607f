/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace palsav::zlib {
/**
 * Inflates one zlib stream. `size_hint` only sizes the first allocation and
 * is capped by what the input could plausibly expand to.
 * Throws SaveError(Decompression) on corrupt or truncated input.
 */
std::vector<std::uint8_t> inflate_stream(std::span<const std::uint8_t> compressed, std::size_t size_hint = 0);

// zlib stream at `level` (-1 is zlib's default). Throws SaveError(Decompression) if zlib rejects it.
std::vector<std::uint8_t> deflate_stream(std::span<const std::uint8_t> raw, int level = -1);
}  // namespace palsav::zlib

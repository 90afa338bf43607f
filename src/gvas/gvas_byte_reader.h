/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_error.h"
#include "gvas/gvas_primitives.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>

namespace palsav::gvas {
/**
 * Little-endian cursor over a byte span. Every read is bounds-checked and
 * throws SaveError(MalformedTree) with the offset on truncated input.
 */
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t read_u8() { return take(1)[0]; }

    std::uint16_t read_u16() { return static_cast<std::uint16_t>(read_le(2)); }
    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_le(4)); }
    std::uint64_t read_u64() { return read_le(8); }
    std::int8_t read_i8() { return static_cast<std::int8_t>(read_u8()); }
    std::int16_t read_i16() { return static_cast<std::int16_t>(read_u16()); }
    std::int32_t read_i32() { return static_cast<std::int32_t>(read_u32()); }
    std::int64_t read_i64() { return static_cast<std::int64_t>(read_u64()); }

    float read_f32() {
        const std::uint32_t bits = read_u32();
        float v = 0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double read_f64() {
        const std::uint64_t bits = read_u64();
        double v = 0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    Bytes read_bytes(std::size_t count) {
        const auto s = take(count);
        return Bytes(s.begin(), s.end());
    }

    template <std::size_t N>
    std::array<std::uint8_t, N> read_array() {
        std::array<std::uint8_t, N> out{};
        const auto s = take(N);
        std::memcpy(out.data(), s.data(), N);
        return out;
    }

    Bytes read_rest() { return read_bytes(remaining()); }

    Guid read_guid() { return Guid::from_wire(take(16)); }

    std::optional<Guid> read_optional_guid() {
        if (read_u8() == 0) {
            return std::nullopt;
        }
        return read_guid();
    }

    // Length-prefixed string: >0 single-byte chars with NUL, <0 UTF-16LE units with NUL.
    std::string read_fstring() {
        const std::size_t at = _pos;
        const std::int32_t len = read_i32();
        if (len == 0) {
            return {};
        }
        if (len > 0) {
            auto s = take(static_cast<std::size_t>(len));
            if (s.back() == 0) {
                s = s.first(s.size() - 1);
            }
            return latin1_to_utf8(s);
        }
        if (len == INT32_MIN) {
            fail_at(at, "invalid string length");
        }
        const std::size_t units = static_cast<std::size_t>(-static_cast<std::int64_t>(len));
        if (units > remaining() / 2) {
            fail_at(at, "string length exceeds input");
        }
        auto s = take(units * 2);
        return utf16le_to_utf8(s.first(s.size() - 2));
    }

    [[noreturn]] void fail(const std::string& what) const { fail_at(_pos, what); }

   private:
    std::span<const std::uint8_t> take(std::size_t count) {
        if (count > remaining()) {
            fail_at(_pos, "unexpected end of data (need " + std::to_string(count) + " bytes, "
                              + std::to_string(remaining()) + " left)");
        }
        const auto s = _data.subspan(_pos, count);
        _pos += count;
        return s;
    }

    std::uint64_t read_le(int width) {
        const auto s = take(static_cast<std::size_t>(width));
        std::uint64_t v = 0;
        for (int i = width - 1; i >= 0; i--) {
            v = (v << 8) | s[static_cast<std::size_t>(i)];
        }
        return v;
    }

    [[noreturn]] static void fail_at(std::size_t offset, const std::string& what) {
        throw SaveError(ErrorKind::MalformedTree, what + " at offset " + std::to_string(offset));
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace palsav::gvas

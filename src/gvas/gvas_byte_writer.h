/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_primitives.h"

#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace palsav::gvas {
class ByteWriter {
   public:
    explicit ByteWriter(std::size_t initial_bytes = 256) { buf_.reserve(initial_bytes); }

    std::size_t size() const { return buf_.size(); }
    const Bytes& bytes() const { return buf_; }
    Bytes take() { return std::move(buf_); }

    void write_u8(std::uint8_t v) { buf_.push_back(v); }
    void write_u16(std::uint16_t v) { write_le(v, 2); }
    void write_u32(std::uint32_t v) { write_le(v, 4); }
    void write_u64(std::uint64_t v) { write_le(v, 8); }
    void write_i8(std::int8_t v) { write_u8(static_cast<std::uint8_t>(v)); }
    void write_i16(std::int16_t v) { write_u16(static_cast<std::uint16_t>(v)); }
    void write_i32(std::int32_t v) { write_u32(static_cast<std::uint32_t>(v)); }
    void write_i64(std::int64_t v) { write_u64(static_cast<std::uint64_t>(v)); }

    void write_f32(float v) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u32(bits);
    }

    void write_f64(double v) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, sizeof(bits));
        write_u64(bits);
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    void write_guid(const Guid& g) {
        const auto wire = g.to_wire();
        write_bytes(wire);
    }

    void write_optional_guid(const std::optional<Guid>& g) {
        if (!g) {
            write_u8(0);
            return;
        }
        write_u8(1);
        write_guid(*g);
    }

    void write_fstring(std::string_view s) {
        if (s.empty()) {
            write_i32(0);
            return;
        }
        if (is_ascii(s)) {
            write_i32(static_cast<std::int32_t>(s.size() + 1));
            buf_.insert(buf_.end(), s.begin(), s.end());
            write_u8(0);
            return;
        }
        const std::u16string units = utf8_to_utf16(s);
        write_i32(-static_cast<std::int32_t>(units.size() + 1));
        for (char16_t u : units) {
            write_u16(static_cast<std::uint16_t>(u));
        }
        write_u16(0);
    }

   private:
    void write_le(std::uint64_t v, int width) {
        for (int i = 0; i < width; i++) {
            buf_.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
    }

    Bytes buf_;
};
}  // namespace palsav::gvas

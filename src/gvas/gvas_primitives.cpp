/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_primitives.h"
#include "gvas/gvas_error.h"

#include <algorithm>

namespace palsav::gvas {
namespace {
// Display index -> wire index. The mapping is its own inverse.
constexpr std::array<std::size_t, 16> kGuidSwizzle = {
    3, 2, 1, 0, 7, 6, 5, 4, 11, 10, 9, 8, 15, 14, 13, 12,
};

constexpr char kHexLower[] = "0123456789abcdef";
constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return 26 + (c - 'a');
    }
    if (c >= '0' && c <= '9') {
        return 52 + (c - '0');
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}
}  // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MalformedEnvelope:
            return "malformed envelope";
        case ErrorKind::Decompression:
            return "decompression failure";
        case ErrorKind::MalformedTree:
            return "malformed tree";
        case ErrorKind::SubRecord:
            return "sub-record decode failure";
        case ErrorKind::InvalidTree:
            return "invalid tree";
    }
    return "unknown";
}

Guid Guid::from_wire(std::span<const std::uint8_t> wire) {
    if (wire.size() != 16) {
        throw SaveError(ErrorKind::MalformedTree, "GUID must be 16 bytes");
    }
    Guid g{};
    for (std::size_t i = 0; i < 16; i++) {
        g.bytes[i] = wire[kGuidSwizzle[i]];
    }
    return g;
}

std::array<std::uint8_t, 16> Guid::to_wire() const {
    std::array<std::uint8_t, 16> wire{};
    for (std::size_t i = 0; i < 16; i++) {
        wire[kGuidSwizzle[i]] = bytes[i];
    }
    return wire;
}

std::optional<Guid> Guid::try_parse(std::string_view text) {
    Guid g{};
    std::size_t nibbles = 0;
    for (char c : text) {
        if (c == '-') {
            continue;
        }
        const int n = hex_nibble(c);
        if (n < 0 || nibbles >= 32) {
            return std::nullopt;
        }
        auto& b = g.bytes[nibbles / 2];
        b = static_cast<std::uint8_t>((nibbles % 2 == 0) ? (n << 4) : (b | n));
        nibbles++;
    }
    if (nibbles != 32) {
        return std::nullopt;
    }
    return g;
}

Guid Guid::parse(std::string_view text) {
    auto g = try_parse(text);
    if (!g) {
        throw SaveError(ErrorKind::InvalidTree, "Invalid GUID: " + std::string(text));
    }
    return *g;
}

std::string Guid::to_string() const {
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < 16; i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHexLower[(bytes[i] >> 4) & 0xF]);
        out.push_back(kHexLower[bytes[i] & 0xF]);
    }
    return out;
}

bool Guid::is_zero() const {
    for (auto b : bytes) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

bool is_ascii(std::string_view s) {
    for (unsigned char c : s) {
        if (c >= 0x80) {
            return false;
        }
    }
    return true;
}

std::string latin1_to_utf8(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (auto b : bytes) {
        append_utf8(out, b);
    }
    return out;
}

std::string utf16le_to_utf8(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size() / 2);
    const std::size_t units = bytes.size() / 2;
    for (std::size_t i = 0; i < units; i++) {
        const std::uint32_t u = bytes[2 * i] | (static_cast<std::uint32_t>(bytes[2 * i + 1]) << 8);
        if (u >= 0xD800 && u <= 0xDBFF && i + 1 < units) {
            const std::uint32_t lo =
                bytes[2 * (i + 1)] | (static_cast<std::uint32_t>(bytes[2 * (i + 1) + 1]) << 8);
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
                append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
                i++;
                continue;
            }
        }
        if (u >= 0xD800 && u <= 0xDFFF) {
            append_utf8(out, 0xFFFD);
            continue;
        }
        append_utf8(out, u);
    }
    return out;
}

std::u16string utf8_to_utf16(std::string_view s) {
    std::u16string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        std::uint32_t cp = 0xFFFD;
        std::size_t len = 1;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        }
        if (len > 1) {
            if (i + len > s.size()) {
                cp = 0xFFFD;
                len = s.size() - i;
            } else {
                for (std::size_t k = 1; k < len; k++) {
                    const auto cc = static_cast<unsigned char>(s[i + k]);
                    if ((cc & 0xC0) != 0x80) {
                        cp = 0xFFFD;
                        len = k;
                        break;
                    }
                    cp = (cp << 6) | (cc & 0x3F);
                }
            }
        }
        if (cp >= 0x10000 && cp <= 0x10FFFF) {
            cp -= 0x10000;
            out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
            out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
        } else if (cp > 0x10FFFF) {
            out.push_back(static_cast<char16_t>(0xFFFD));
        } else {
            out.push_back(static_cast<char16_t>(cp));
        }
        i += len;
    }
    return out;
}

std::string base64_encode(std::span<const std::uint8_t> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    for (std::size_t i = 0; i < data.size(); i += 3) {
        const std::size_t n = std::min<std::size_t>(3, data.size() - i);
        const std::uint32_t b0 = data[i];
        const std::uint32_t b1 = n > 1 ? data[i + 1] : 0;
        const std::uint32_t b2 = n > 2 ? data[i + 2] : 0;
        const std::uint32_t triple = (b0 << 16) | (b1 << 8) | b2;
        out.push_back(kBase64Alphabet[(triple >> 18) & 0x3F]);
        out.push_back(kBase64Alphabet[(triple >> 12) & 0x3F]);
        out.push_back(n > 1 ? kBase64Alphabet[(triple >> 6) & 0x3F] : '=');
        out.push_back(n > 2 ? kBase64Alphabet[triple & 0x3F] : '=');
    }
    return out;
}

Bytes base64_decode(std::string_view text) {
    Bytes out;
    out.reserve(text.size() * 3 / 4);
    std::uint32_t buf = 0;
    int bits = 0;
    for (char c : text) {
        if (c == '=' || c == '\n' || c == '\r' || c == ' ') {
            continue;
        }
        const int v = base64_index(c);
        if (v < 0) {
            throw SaveError(ErrorKind::InvalidTree, "Invalid base64 character");
        }
        buf = (buf << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((buf >> bits) & 0xFFu));
            buf &= (1u << bits) - 1u;
        }
    }
    return out;
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.resize(bytes.size() * 2);
    for (std::size_t i = 0; i < bytes.size(); i++) {
        out[i * 2] = kHexLower[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHexLower[bytes[i] & 0xF];
    }
    return out;
}
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/sav_envelope.h"

#include "gvas/gvas_byte_reader.h"
#include "gvas/gvas_byte_writer.h"
#include "gvas/gvas_error.h"
#include "oodle/oodle_api.h"
#include "zlib/zlib_codec.h"

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

namespace palsav::gvas {
namespace {
constexpr std::array<std::uint8_t, 3> kMagicPlZ = {'P', 'l', 'Z'};
constexpr std::array<std::uint8_t, 3> kMagicPlM = {'P', 'l', 'M'};
constexpr std::array<std::uint8_t, 3> kMagicCnk = {'C', 'N', 'K'};

[[noreturn]] void bad_envelope(const std::string& what) {
    throw SaveError(ErrorKind::MalformedEnvelope, what);
}

std::string hex_byte(std::uint8_t b) {
    const std::uint8_t one[1] = {b};
    return "0x" + to_hex(one);
}

void write_header(ByteWriter& w, std::uint32_t uncompressed, std::uint32_t compressed,
                  const std::array<std::uint8_t, 3>& magic, std::uint8_t save_type) {
    w.write_u32(uncompressed);
    w.write_u32(compressed);
    w.write_bytes(magic);
    w.write_u8(save_type);
}

std::uint32_t length_field(std::size_t n) {
    if (n > UINT32_MAX) {
        throw SaveError(ErrorKind::InvalidTree, "archive larger than 4 GiB");
    }
    return static_cast<std::uint32_t>(n);
}

void check_declared(std::uint32_t n, const char* field) {
    if (n > kMaxDeclaredLength) {
        throw SaveError(ErrorKind::Decompression,
                        std::string(field) + " of " + std::to_string(n) + " bytes exceeds the 2 GiB limit");
    }
}
}  // namespace

SavHeader parse_sav_header(std::span<const std::uint8_t> data) {
    if (data.size() < kSavHeaderSize) {
        bad_envelope("archive of " + std::to_string(data.size()) + " bytes is shorter than its header");
    }
    ByteReader r(data.first(kSavHeaderSize));
    SavHeader h;
    h.uncompressed_len = r.read_u32();
    h.compressed_len = r.read_u32();
    h.magic = r.read_array<3>();
    h.save_type = r.read_u8();
    return h;
}

DecompressedSav decompress_sav(std::span<const std::uint8_t> data, OodleApi* oodle) {
    SavHeader h = parse_sav_header(data);
    std::size_t offset = kSavHeaderSize;
    DecompressedSav out;
    if (h.magic == kMagicCnk) {
        if (data.size() < kWrappedHeaderSize) {
            bad_envelope("CNK archive is too small for its inner header");
        }
        h = parse_sav_header(data.subspan(kSavHeaderSize));
        offset = kWrappedHeaderSize;
        out.wrapped = true;
    }
    if (h.magic != kMagicPlZ && h.magic != kMagicPlM) {
        bad_envelope("unknown archive magic " + to_hex(h.magic));
    }
    out.save_type = h.save_type;
    check_declared(h.uncompressed_len, "uncompressed length");
    if (h.save_type == kSaveTypeDoubleZlib) {
        check_declared(h.compressed_len, "intermediate length");
    }
    const auto payload = data.subspan(offset);

    switch (h.save_type) {
        case kSaveTypeDoubleZlib: {
            const Bytes first = zlib::inflate_stream(payload, h.compressed_len);
            out.gvas = zlib::inflate_stream(first, h.uncompressed_len);
            break;
        }
        case kSaveTypeOodle: {
            if (!oodle) {
                throw SaveError(ErrorKind::Decompression, "PlM archive needs the Oodle runtime");
            }
            if (h.uncompressed_len == 0) {
                throw SaveError(ErrorKind::Decompression, "PlM archive declares an empty payload");
            }
            const auto compressed = (h.compressed_len > 0 && h.compressed_len <= payload.size())
                ? payload.first(h.compressed_len)
                : payload;
            try {
                out.gvas.resize(h.uncompressed_len);
            } catch (const std::bad_alloc&) {
                throw SaveError(ErrorKind::Decompression,
                                "cannot allocate " + std::to_string(h.uncompressed_len) + " bytes for Oodle output");
            }
            try {
                oodle->decompress(compressed, out.gvas);
            } catch (const std::runtime_error& e) {
                throw SaveError(ErrorKind::Decompression, e.what());
            }
            if (out.gvas.size() < 4 || std::memcmp(out.gvas.data(), "GVAS", 4) != 0) {
                throw SaveError(ErrorKind::Decompression, "Oodle output does not start with GVAS");
            }
            break;
        }
        case kSaveTypeSingleZlib:
            out.gvas = zlib::inflate_stream(payload, h.uncompressed_len);
            break;
        default:
            bad_envelope("unsupported save type " + hex_byte(h.save_type));
    }
    return out;
}

std::uint8_t written_save_type(std::uint8_t save_type) {
    return save_type == kSaveTypeOodle ? kSaveTypeDoubleZlib : save_type;
}

Bytes compress_sav(std::span<const std::uint8_t> gvas, std::uint8_t save_type, bool wrap_single_zlib) {
    const std::uint8_t type = written_save_type(save_type);
    ByteWriter w(gvas.size() / 4 + kWrappedHeaderSize);
    switch (type) {
        case kSaveTypeDoubleZlib: {
            const Bytes once = zlib::deflate_stream(gvas);
            const Bytes twice = zlib::deflate_stream(once);
            // compressed_len names the intermediate stream, not the bytes on disk.
            write_header(w, length_field(gvas.size()), length_field(once.size()), kMagicPlZ, type);
            w.write_bytes(twice);
            break;
        }
        case kSaveTypeSingleZlib: {
            const Bytes compressed = zlib::deflate_stream(gvas);
            if (wrap_single_zlib) {
                write_header(w, length_field(gvas.size()), length_field(compressed.size() + kSavHeaderSize),
                             kMagicCnk, type);
            }
            write_header(w, length_field(gvas.size()), length_field(compressed.size()), kMagicPlZ, type);
            w.write_bytes(compressed);
            break;
        }
        default:
            throw SaveError(ErrorKind::InvalidTree, "cannot write save type " + hex_byte(save_type));
    }
    return w.take();
}
}  // namespace palsav::gvas

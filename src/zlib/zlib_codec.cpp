/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "zlib/zlib_codec.h"

#include "gvas/gvas_error.h"

#include <zlib.h>

#include <algorithm>
#include <limits>
#include <new>
#include <string>

namespace palsav::zlib {
namespace {
using gvas::ErrorKind;
using gvas::SaveError;

constexpr std::size_t kMinChunk = 64 * 1024;
// deflate never exceeds roughly 1032:1, so a larger hint is not trusted.
constexpr std::size_t kMaxRatio = 1032;

[[noreturn]] void fail(const char* op, int code, const z_stream& stream) {
    std::string msg = std::string(op) + " failed (" + std::to_string(code) + ")";
    if (stream.msg) {
        msg += ": ";
        msg += stream.msg;
    }
    throw SaveError(ErrorKind::Decompression, msg);
}
}  // namespace

std::vector<std::uint8_t> inflate_stream(std::span<const std::uint8_t> compressed, std::size_t size_hint) {
    if (compressed.size() > std::numeric_limits<uInt>::max()) {
        throw SaveError(ErrorKind::Decompression, "zlib input too large");
    }
    z_stream stream{};
    int rc = inflateInit(&stream);
    if (rc != Z_OK) {
        fail("inflateInit", rc, stream);
    }

    const std::size_t ceiling = std::max(compressed.size() * kMaxRatio, kMinChunk);
    std::vector<std::uint8_t> out;
    try {
        out.resize(std::clamp(size_hint, kMinChunk, ceiling));
    } catch (const std::bad_alloc&) {
        inflateEnd(&stream);
        throw SaveError(ErrorKind::Decompression, "zlib output buffer allocation failed");
    }
    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());
    while (true) {
        if (stream.total_out == out.size()) {
            try {
                out.resize(out.size() * 2);
            } catch (const std::bad_alloc&) {
                inflateEnd(&stream);
                throw SaveError(ErrorKind::Decompression, "zlib output exceeds available memory");
            }
        }
        const std::size_t room = std::min<std::size_t>(out.size() - stream.total_out, std::numeric_limits<uInt>::max());
        stream.next_out = out.data() + stream.total_out;
        stream.avail_out = static_cast<uInt>(room);

        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            break;
        }
        if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
            inflateEnd(&stream);
            throw SaveError(ErrorKind::Decompression, "zlib stream is truncated");
        }
        if (rc != Z_OK && rc != Z_BUF_ERROR) {
            const z_stream failed = stream;
            inflateEnd(&stream);
            fail("inflate", rc, failed);
        }
    }
    out.resize(stream.total_out);
    inflateEnd(&stream);
    return out;
}

std::vector<std::uint8_t> deflate_stream(std::span<const std::uint8_t> raw, int level) {
    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::vector<std::uint8_t> out(bound);
    const int rc = compress2(out.data(), &bound, raw.data(), static_cast<uLong>(raw.size()), level);
    if (rc != Z_OK) {
        throw SaveError(ErrorKind::Decompression, "compress2 failed (" + std::to_string(rc) + ")");
    }
    out.resize(bound);
    return out;
}
}  // namespace palsav::zlib

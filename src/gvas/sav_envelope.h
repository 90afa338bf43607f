/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_primitives.h"

#include <array>
#include <cstdint>
#include <span>

namespace palsav {
class OodleApi;
}

namespace palsav::gvas {
constexpr std::uint8_t kSaveTypeSingleZlib = 0x30;
constexpr std::uint8_t kSaveTypeOodle = 0x31;
constexpr std::uint8_t kSaveTypeDoubleZlib = 0x32;

constexpr std::size_t kSavHeaderSize = 12;
constexpr std::size_t kWrappedHeaderSize = 24;
// Largest declared stream length decompress_sav will allocate for.
constexpr std::uint32_t kMaxDeclaredLength = 0x80000000u;

struct SavHeader {
    std::uint32_t uncompressed_len = 0;
    std::uint32_t compressed_len = 0;
    std::array<std::uint8_t, 3> magic{};
    std::uint8_t save_type = 0;
};

struct DecompressedSav {
    Bytes gvas;
    std::uint8_t save_type = 0;
    // The archive carried the 24-byte CNK wrapper.
    bool wrapped = false;
};

SavHeader parse_sav_header(std::span<const std::uint8_t> data);

/**
 * Strips the .sav envelope. `oodle` may be null; PlM archives then fail
 * with SaveError(Decompression).
 */
DecompressedSav decompress_sav(std::span<const std::uint8_t> data, OodleApi* oodle);

/**
 * Wraps GVAS bytes in an envelope. PlM (0x31) is written as double-deflate
 * since only the decoder side of Oodle is available. `wrap_single_zlib`
 * adds the CNK wrapper to single-deflate archives.
 */
Bytes compress_sav(std::span<const std::uint8_t> gvas, std::uint8_t save_type, bool wrap_single_zlib = false);

// Variant compress_sav actually writes for `save_type`.
std::uint8_t written_save_type(std::uint8_t save_type);
}  // namespace palsav::gvas

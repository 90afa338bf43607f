/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_policy.h"
#include "gvas/gvas_types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace palsav {

struct DecodeOptions {
    // Oodle runtime for PlM archives; the library next to the executable is tried otherwise.
    std::optional<std::filesystem::path> oodle_path;
    const gvas::PolicyTable* policy = nullptr;
    bool debug = false;
};

struct DecodeResult {
    gvas::SaveFile save;
    std::uint8_t save_type = 0;
    bool wrapped = false;
    std::vector<std::string> warnings;
};

struct EncodeOptions {
    // Re-create the 24-byte CNK wrapper around single-deflate archives.
    bool wrap_single_zlib = false;
    bool debug = false;
};

struct EncodeResult {
    std::vector<std::uint8_t> gvas_payload;
    std::vector<std::uint8_t> sav_bytes;
    std::uint8_t save_type = 0;
};

class SaveCodec {
   public:
    static DecodeResult DecodeSavFile(const std::filesystem::path& path, const DecodeOptions& opt = {});
    static DecodeResult DecodeSavBytes(
        std::span<const std::uint8_t> bytes,
        const DecodeOptions& opt = {},
        std::string_view label = {}
    );
    static DecodeResult DecodeGvasBytes(
        std::span<const std::uint8_t> bytes,
        const DecodeOptions& opt = {},
        std::string_view label = {}
    );

    static EncodeResult EncodeSav(
        const gvas::SaveFile& save,
        std::uint8_t save_type,
        const EncodeOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace palsav

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace palsav {
/**
 * Oodle runtime loaded from the shared library shipped with the game
 * (oo2core_9). Only decompression is exposed; PlM archives are rewritten
 * as double-deflate on save.
 */
class OodleApi {
   public:
    static std::filesystem::path default_library_path();
    // nullptr when the default library is absent or unusable.
    static std::unique_ptr<OodleApi> try_load_default();
    static std::unique_ptr<OodleApi> load(const std::filesystem::path& lib_path);

    ~OodleApi();
    OodleApi(const OodleApi&) = delete;
    OodleApi& operator=(const OodleApi&) = delete;

    // Fills `decompressed` completely or throws std::runtime_error.
    void decompress(std::span<const std::uint8_t> compressed, std::span<std::uint8_t> decompressed);

   private:
    OodleApi(void* handle, void* decompress_fn);

    void* handle_ = nullptr;
    void* decompress_fn_ = nullptr;
};
}  // namespace palsav

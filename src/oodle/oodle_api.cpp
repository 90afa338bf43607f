/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "oodle/oodle_api.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <stdexcept>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace palsav {
namespace {
#if defined(_WIN32)
void* load_library_handle(const fs::path& p) {
    const std::wstring w = p.wstring();
    return reinterpret_cast<void*>(::LoadLibraryW(w.c_str()));
}

void unload_library_handle(void* h) {
    if (h) {
        ::FreeLibrary(reinterpret_cast<HMODULE>(h));
    }
}

void* get_export(void* h, const char* name) {
    return h ? reinterpret_cast<void*>(::GetProcAddress(reinterpret_cast<HMODULE>(h), name)) : nullptr;
}
#else
void* load_library_handle(const fs::path& p) {
    return ::dlopen(p.string().c_str(), RTLD_NOW);
}

void unload_library_handle(void* h) {
    if (h) {
        ::dlclose(h);
    }
}

void* get_export(void* h, const char* name) {
    return h ? ::dlsym(h, name) : nullptr;
}
#endif

using OodleLZ_DecompressFn = long (*)(
    const void* compBuf,
    long compBufSize,
    void* rawBuf,
    long rawLen,
    int fuzzSafe,
    int checkCrc,
    int verbosity,
    void* rawBufBase,
    long rawBufSize,
    void* callback,
    void* callbackUser,
    void* decoderMemory,
    long decoderMemorySize,
    int threadPhase
);
}  // namespace

fs::path OodleApi::default_library_path() {
    const fs::path dir = fs_utils::executable_dir();
#if defined(_WIN32)
    return dir / "oo2core_9_win64.dll";
#elif defined(__aarch64__)
    return dir / "liboo2corelinuxarm64.so.9";
#else
    return dir / "liboo2corelinux64.so.9";
#endif
}

std::unique_ptr<OodleApi> OodleApi::try_load_default() {
    const fs::path cand = default_library_path();
    std::error_code ec;
    if (!fs::exists(cand, ec) || ec) {
        return nullptr;
    }
    try {
        return load(cand);
    } catch (const std::exception& ex) {
        PALSAV_LOG_ERROR("Failed to load Oodle from %s: %s", cand.filename().string().c_str(), ex.what());
        return nullptr;
    }
}

std::unique_ptr<OodleApi> OodleApi::load(const fs::path& lib_path) {
    void* h = load_library_handle(lib_path);
    if (!h) {
        throw std::runtime_error("Failed to load Oodle library: " + lib_path.string());
    }
    void* decompress = get_export(h, "OodleLZ_Decompress");
    if (!decompress) {
        unload_library_handle(h);
        throw std::runtime_error("Missing Oodle export: OodleLZ_Decompress");
    }
    return std::unique_ptr<OodleApi>(new OodleApi(h, decompress));
}

OodleApi::OodleApi(void* handle, void* decompress_fn) : handle_(handle), decompress_fn_(decompress_fn) {}

OodleApi::~OodleApi() {
    unload_library_handle(handle_);
    handle_ = nullptr;
}

void OodleApi::decompress(std::span<const std::uint8_t> compressed, std::span<std::uint8_t> decompressed) {
    if (compressed.empty()) {
        throw std::runtime_error("Oodle decompress: compressed buffer is empty");
    }
    if (decompressed.empty()) {
        throw std::runtime_error("Oodle decompress: destination buffer is empty");
    }

    auto fn = reinterpret_cast<OodleLZ_DecompressFn>(decompress_fn_);
    const long res = fn(compressed.data(), static_cast<long>(compressed.size()), decompressed.data(),
                        static_cast<long>(decompressed.size()), 1, 1, 0, nullptr, 0, nullptr, nullptr, nullptr, 0, 3);
    if (res != static_cast<long>(decompressed.size())) {
        throw std::runtime_error("OodleLZ_Decompress produced " + std::to_string(res) + " of "
                                 + std::to_string(decompressed.size()) + " bytes");
    }
}
}  // namespace palsav

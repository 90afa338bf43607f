/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "sav_codec.h"

#include "gvas/gvas_error.h"
#include "gvas/gvas_reader.h"
#include "gvas/gvas_writer.h"
#include "gvas/sav_envelope.h"
#include "oodle/oodle_api.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <array>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace palsav {

static std::unique_ptr<OodleApi> load_oodle(const DecodeOptions& opt) {
    if (opt.oodle_path.has_value()) {
        return OodleApi::load(*opt.oodle_path);
    }
    return OodleApi::try_load_default();
}

static long long elapsed_ms(std::chrono::steady_clock::time_point from, std::chrono::steady_clock::time_point to) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
}

DecodeResult SaveCodec::DecodeSavFile(const std::filesystem::path& path, const DecodeOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw gvas::SaveError(gvas::ErrorKind::MalformedEnvelope, "SAV file is empty: " + path.string());
    }
    return DecodeSavBytes(bytes, opt, path.filename().string());
}

DecodeResult SaveCodec::DecodeSavBytes(
    std::span<const std::uint8_t> bytes,
    const DecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    std::unique_ptr<OodleApi> oodle;
    auto header = gvas::parse_sav_header(bytes);
    if (header.magic == std::array<std::uint8_t, 3>{'C', 'N', 'K'} && bytes.size() >= gvas::kWrappedHeaderSize) {
        header = gvas::parse_sav_header(bytes.subspan(gvas::kSavHeaderSize));
    }
    if (header.save_type == gvas::kSaveTypeOodle) {
        try {
            oodle = load_oodle(opt);
        } catch (const std::runtime_error& e) {
            throw gvas::SaveError(gvas::ErrorKind::Decompression, e.what());
        }
    }
    auto raw = gvas::decompress_sav(bytes, oodle.get());
    const auto t1 = std::chrono::steady_clock::now();

    DecodeResult result = DecodeGvasBytes(raw.gvas, opt, label);
    result.save_type = raw.save_type;
    result.wrapped = raw.wrapped;
    if (opt.debug) {
        PALSAV_LOG_INFO(
            "Decode %s: type=0x%02X%s gvas=%zu bytes envelope=%lldms",
            std::string(label).c_str(), raw.save_type, raw.wrapped ? " (CNK)" : "", raw.gvas.size(),
            elapsed_ms(t0, t1)
        );
    }
    return result;
}

DecodeResult SaveCodec::DecodeGvasBytes(
    std::span<const std::uint8_t> bytes,
    const DecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const gvas::PolicyTable& policy = opt.policy ? *opt.policy : gvas::PolicyTable::defaults();

    DecodeResult result{};
    result.save = gvas::read_save(bytes, policy, &result.warnings);
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.debug) {
        for (const auto& w : result.warnings) {
            PALSAV_LOG_WARN("%s: %s", std::string(label).c_str(), w.c_str());
        }
        PALSAV_LOG_INFO(
            "Decode %s: properties=%zu trailer=%zu bytes tree=%lldms", std::string(label).c_str(),
            result.save.properties.size(), result.save.trailer.size(), elapsed_ms(t0, t1)
        );
    }
    return result;
}

EncodeResult SaveCodec::EncodeSav(
    const gvas::SaveFile& save,
    std::uint8_t save_type,
    const EncodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    EncodeResult result{};
    result.gvas_payload = gvas::write_save(save);
    const auto t1 = std::chrono::steady_clock::now();

    result.save_type = gvas::written_save_type(save_type);
    if (opt.debug && result.save_type != save_type) {
        PALSAV_LOG_INFO(
            "Encode %s: writing type 0x%02X as 0x%02X", std::string(label).c_str(), save_type, result.save_type
        );
    }
    result.sav_bytes = gvas::compress_sav(result.gvas_payload, save_type, opt.wrap_single_zlib);
    const auto t2 = std::chrono::steady_clock::now();

    if (opt.debug) {
        PALSAV_LOG_INFO(
            "Encode %s: tree=%lldms envelope=%lldms size=%zu", std::string(label).c_str(), elapsed_ms(t0, t1),
            elapsed_ms(t1, t2), result.sav_bytes.size()
        );
    }
    return result;
}

}  // namespace palsav

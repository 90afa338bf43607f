/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_identity_swap.h"
#include "gvas/gvas_json.h"
#include "gvas/sav_envelope.h"
#include "sav_codec.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "world/level_players.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using palsav::gvas::Guid;

struct SwapPair {
    Guid a;
    Guid b;
};

struct Settings {
    bool list_players = false;
    bool wrap = false;
    bool debug = false;
    std::optional<SwapPair> swap;
    std::optional<fs::path> out_root;
    std::optional<fs::path> oodle_path;
};

static void print_usage() {
    PALSAV_LOG_INFO(
        "Usage:\n" \
        "    palsav <file-or-dir> [--players] [--swap <uidA> <uidB>] [--out <dir>] [--oodle <path>] [--wrap] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory\n" \
        "    --players     prints the players of a Level.sav\n" \
        "    --swap        exchanges two player uids and writes the patched .sav\n" \
        "    --out         output root (default: output/ next to the executable)\n" \
        "    --oodle       path to the Oodle runtime for PlM saves\n" \
        "    --wrap        writes single-deflate saves with the CNK wrapper\n" \
        "    --debug       enables extra logging\n"
    );
    PALSAV_LOG_INFO("[INFO] JSON inputs are encoded with the save_type recorded in the document.");
}

static nlohmann::ordered_json read_json_file(const fs::path& path, bool debug) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto bytes = palsav::fs_utils::read_file(path);
    if (bytes.empty()) {
        throw std::runtime_error("JSON file is empty: " + path.string());
    }
    auto json = nlohmann::ordered_json::parse(bytes.begin(), bytes.end());
    const auto t1 = std::chrono::steady_clock::now();
    if (debug) {
        PALSAV_LOG_INFO(
            "JSON read %s: bytes=%zu parse=%lldms",
            path.string().c_str(), bytes.size(),
            static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count())
        );
    }
    return json;
}

static void print_players(const palsav::gvas::SaveFile& level) {
    const auto players = palsav::world::extract_level_players(level);
    if (players.empty()) {
        PALSAV_LOG_INFO("No players found.");
        return;
    }
    for (const auto& p : players) {
        PALSAV_LOG_INFO(
            "%s  %-24s lv%-3u pals=%-4zu %-12s %s",
            p.filename.c_str(), p.name.c_str(), p.level, p.pals_count,
            p.last_online.c_str(), p.guild_name.c_str()
        );
    }
}

static bool is_level_save(const palsav::gvas::SaveFile& save) {
    return palsav::gvas::find_property(save.properties, "worldSaveData") != nullptr;
}

// Player saves are named after their uid; a swapped one moves to the other uid's name.
static std::string swapped_base(const std::string& base, const SwapPair& swap) {
    if (base == palsav::world::player_save_filename(swap.a)) {
        return palsav::world::player_save_filename(swap.b);
    }
    if (base == palsav::world::player_save_filename(swap.b)) {
        return palsav::world::player_save_filename(swap.a);
    }
    return base;
}

static std::size_t apply_swap(palsav::gvas::SaveFile& save, const SwapPair& swap) {
    if (is_level_save(save)) {
        const auto ia = palsav::world::find_player_instance_id(save, swap.a);
        const auto ib = palsav::world::find_player_instance_id(save, swap.b);
        if (ia && ib) {
            return palsav::world::swap_level_players(save, {swap.a, *ia}, {swap.b, *ib});
        }
        PALSAV_LOG_WARN("Player characters not found for both uids; swapping watched fields only");
        return palsav::gvas::swap_identity(save, swap.a, swap.b);
    }
    const std::size_t patched = palsav::world::patch_player_save(save, swap.a, swap.b);
    if (patched > 0) {
        return patched;
    }
    return palsav::world::patch_player_save(save, swap.b, swap.a);
}

static void write_sav(
    const fs::path& out_sav_dir,
    const std::string& base,
    const palsav::gvas::SaveFile& save,
    std::uint8_t save_type,
    bool wrap,
    const Settings& settings
) {
    palsav::EncodeOptions opt{};
    opt.wrap_single_zlib = wrap;
    opt.debug = settings.debug;
    const auto res = palsav::SaveCodec::EncodeSav(save, save_type, opt, base);
    const fs::path sav_path = out_sav_dir / (base + std::string(".sav"));
    palsav::fs_utils::write_file(sav_path, res.sav_bytes);
    PALSAV_LOG_INFO("Wrote: %s", sav_path.string().c_str());
}

static void process_file(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    if (!palsav::fs_utils::is_supported_input(path)) {
        PALSAV_LOG_INFO("Skipped: %s", path.string().c_str());
        return;
    }

    const std::string base = path.stem().string();
    const fs::path out_json_dir = out_root / "json";
    const fs::path out_sav_dir = out_root / "sav";
    try {
        if (path.extension() == ".sav") {
            palsav::DecodeOptions opt{};
            opt.oodle_path = settings.oodle_path;
            opt.debug = settings.debug;
            auto res = palsav::SaveCodec::DecodeSavFile(path, opt);
            // --debug already logged them during the decode.
            if (!settings.debug) {
                for (const auto& w : res.warnings) {
                    PALSAV_LOG_WARN("%s: %s", path.filename().string().c_str(), w.c_str());
                }
            }

            auto doc = palsav::gvas::to_json(res.save, res.save_type);
            if (res.wrapped) {
                doc["wrapped"] = true;
            }
            const fs::path json_path = out_json_dir / (base + std::string(".json"));
            palsav::fs_utils::write_text_file(json_path, doc.dump(2));
            PALSAV_LOG_INFO("Wrote: %s", json_path.string().c_str());

            if (settings.list_players && is_level_save(res.save)) {
                print_players(res.save);
            }
            if (settings.swap) {
                const std::size_t changed = apply_swap(res.save, *settings.swap);
                PALSAV_LOG_INFO("Swapped %zu field(s) in %s", changed, path.filename().string().c_str());
                write_sav(out_sav_dir, swapped_base(base, *settings.swap), res.save, res.save_type,
                          settings.wrap || res.wrapped, settings);
            }
        } else if (path.extension() == ".json") {
            const auto doc = read_json_file(path, settings.debug);
            auto save = palsav::gvas::save_from_json(doc);
            const std::uint8_t save_type = palsav::gvas::save_type_of(doc).value_or(palsav::gvas::kSaveTypeDoubleZlib);
            const bool wrapped = doc.contains("wrapped") && doc["wrapped"].is_boolean() && doc["wrapped"].get<bool>();
            std::string out_base = base;
            if (settings.swap) {
                const std::size_t changed = apply_swap(save, *settings.swap);
                PALSAV_LOG_INFO("Swapped %zu field(s) in %s", changed, path.filename().string().c_str());
                out_base = swapped_base(base, *settings.swap);
            }
            write_sav(out_sav_dir, out_base, save, save_type, settings.wrap || wrapped, settings);
        }
    } catch (const std::exception& e) {
        PALSAV_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        PALSAV_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--players") {
            settings.list_players = true;
            continue;
        }
        if (arg == "--wrap") {
            settings.wrap = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--swap") {
            if (i + 2 >= argc) {
                PALSAV_LOG_ERROR("Missing values for --swap");
                return 2;
            }
            const auto a = Guid::try_parse(argv[++i]);
            const auto b = Guid::try_parse(argv[++i]);
            if (!a || !b) {
                PALSAV_LOG_ERROR("--swap expects two player uids (32 hex digits)");
                return 2;
            }
            settings.swap = SwapPair{*a, *b};
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                PALSAV_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_root = fs::path(argv[++i]);
            continue;
        }
        if (arg == "--oodle") {
            if (i + 1 >= argc) {
                PALSAV_LOG_ERROR("Missing value for --oodle");
                return 2;
            }
            settings.oodle_path = fs::path(argv[++i]);
            continue;
        }
        PALSAV_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        PALSAV_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = settings.out_root.value_or(palsav::fs_utils::executable_dir() / "output");
    palsav::fs_utils::ensure_dir(out_root);

    if (fs::is_directory(input)) {
        const auto inputs = palsav::fs_utils::collect_inputs(input);
        for (const auto& p : inputs) {
            process_file(p, out_root, settings);
        }
        return 0;
    }

    process_file(input, out_root, settings);
    return 0;
}

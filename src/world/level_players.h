/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace palsav::world {
// .NET DateTime ticks (100 ns) at the Unix epoch.
constexpr std::uint64_t kUnixEpochTicks = 621355968000000000ULL;
constexpr std::int64_t kTicksPerSecond = 10000000;

struct LevelPlayer {
    gvas::Guid uid;
    // Player save file stem: the uid as 32 lowercase hex digits.
    std::string filename;
    std::string name;
    std::uint32_t level = 0;
    std::size_t pals_count = 0;
    std::string last_online;
    std::string guild_name;
};

// A player as the level sees it: the uid plus the character instance id from its player save.
struct PlayerRef {
    gvas::Guid uid;
    gvas::Guid instance_id;
};

std::string player_save_filename(const gvas::Guid& uid);

std::string format_last_seen(std::int64_t last_online_ticks, std::uint64_t now_ticks);

/**
 * Summarizes the players of a Level save from guild membership and the
 * character map. `now_ticks` defaults to the world's
 * GameTimeSaveData.RealDateTimeTicks, the clock guild timestamps use.
 */
std::vector<LevelPlayer> extract_level_players(const gvas::SaveFile& level,
                                               std::optional<std::uint64_t> now_ticks = std::nullopt);

std::optional<gvas::Guid> read_player_instance_id(const gvas::SaveFile& player_save);

// InstanceId of the player character keyed by `uid` in the level's CharacterSaveParameterMap.
std::optional<gvas::Guid> find_player_instance_id(const gvas::SaveFile& level, const gvas::Guid& uid);

// Rewrites SaveData.PlayerUId and SaveData.IndividualId.PlayerUId where they equal `old_uid`.
std::size_t patch_player_save(gvas::SaveFile& player_save, const gvas::Guid& old_uid, const gvas::Guid& new_uid);

/**
 * Exchanges two players in a Level save: the PlayerUId keys of their own
 * character entries (matched by instance id), then every watched identity
 * field under worldSaveData. Returns the number of fields changed.
 */
std::size_t swap_level_players(gvas::SaveFile& level, const PlayerRef& a, const PlayerRef& b);
}  // namespace palsav::world

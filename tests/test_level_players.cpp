/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <catch2/catch.hpp>

#include "fixture_builder.h"
#include "gvas/gvas_reader.h"
#include "gvas/gvas_writer.h"
#include "world/level_players.h"

#include <cstdint>
#include <string>

using namespace palsav::gvas;
using namespace palsav::world;
using namespace palsav::fixture;

namespace {
constexpr const char* kAlice = "a1000000-0000-0000-0000-000000000001";
constexpr const char* kBob = "b0000000-0000-0000-0000-000000000002";
constexpr const char* kAliceInstance = "1a000000-0000-0000-0000-000000000001";
constexpr const char* kBobInstance = "1b000000-0000-0000-0000-000000000002";
constexpr const char* kGuild = "6a000000-0000-0000-0000-000000000001";
constexpr const char* kNobody = "00000000-0000-0000-0000-000000000000";

constexpr std::int64_t kHour = 3600 * kTicksPerSecond;
constexpr std::int64_t kNow = static_cast<std::int64_t>(kUnixEpochTicks) + 1000 * kHour;

Buf player_parameters(std::string_view nick, bool with_level) {
    Buf p;
    p.raw(bool_prop("IsPlayer", true));
    if (with_level) {
        p.raw(byte_prop("Level", 12));
    }
    p.raw(str_prop("NickName", nick));
    return p;
}

Buf pal_parameters(std::string_view owner) {
    Buf p;
    p.raw(name_prop("CharacterID", "PinkCat"));
    p.raw(byte_prop("Level", 4));
    p.raw(guid_prop("OwnerPlayerUId", owner));
    return p;
}

// Alice is in a guild with two pals; Bob has a character but no guild.
Blob level() {
    Buf groups;
    groups.raw(group_entry(kGuild, "EPalGroupType::Guild",
                           guild_blob(kGuild, {{kAlice, kAliceInstance}}, kAlice, {{kAlice, kNow - 2 * kHour, "Alice"}},
                                      "Night Shift")));

    Buf characters;
    characters.raw(character_entry(kAlice, kAliceInstance, character_blob(player_parameters("AliceNick", true), kGuild)));
    characters.raw(character_entry(kBob, kBobInstance, character_blob(player_parameters("Bobby", false), kGuild)));
    characters.raw(character_entry(kNobody, "1c000000-0000-0000-0000-000000000003",
                                   character_blob(pal_parameters(kAlice), kGuild)));
    characters.raw(character_entry(kNobody, "1c000000-0000-0000-0000-000000000004",
                                   character_blob(pal_parameters(kAlice), kGuild)));

    Buf world;
    world.raw(scope_prop("GameTimeSaveData", "PalGameTimeSaveData", int64_prop("RealDateTimeTicks", kNow)));
    world.raw(map_prop("GroupSaveDataMap", "StructProperty", "StructProperty", 1, groups));
    world.raw(map_prop("CharacterSaveParameterMap", "StructProperty", "StructProperty", 4, characters));
    return gvas_file(scope_prop("worldSaveData", "PalWorldSaveData", world));
}

Blob player_save(std::string_view uid) {
    Buf individual;
    individual.raw(guid_prop("PlayerUId", uid)).raw(guid_prop("InstanceId", kAliceInstance));
    Buf data;
    data.raw(guid_prop("PlayerUId", uid));
    data.raw(scope_prop("IndividualId", "PalInstanceID", individual));
    data.raw(int_prop("PlayerCount", 1));
    return gvas_file(scope_prop("SaveData", "PalWorldPlayerSaveData", data));
}
}  // namespace

TEST_CASE("Player save file names are the bare lowercase uid", "[world]") {
    CHECK(player_save_filename(Guid::parse("A1000000-0000-0000-0000-00000000000F")) == "a100000000000000000000000000000f");
}

TEST_CASE("Last seen is rendered relative to the world clock", "[world]") {
    const std::uint64_t now = static_cast<std::uint64_t>(kNow);
    CHECK(format_last_seen(0, now) == "Unknown");
    CHECK(format_last_seen(-5, now) == "Unknown");
    CHECK(format_last_seen(kNow + kHour, now) == "Online now");
    CHECK(format_last_seen(kNow - 30 * kTicksPerSecond, now) == "Online now");
    CHECK(format_last_seen(kNow - 5 * 60 * kTicksPerSecond, now) == "5 min ago");
    CHECK(format_last_seen(kNow - 3 * kHour, now) == "3h ago");
    CHECK(format_last_seen(kNow - 50 * kHour, now) == "2d ago");
}

TEST_CASE("Level players combine guild membership and characters", "[world]") {
    const SaveFile save = read_save(level());
    const auto players = extract_level_players(save);
    REQUIRE(players.size() == 2);

    const LevelPlayer& alice = players[0];
    CHECK(alice.uid == Guid::parse(kAlice));
    CHECK(alice.filename == "a1000000000000000000000000000001");
    CHECK(alice.name == "Alice");
    CHECK(alice.level == 12);
    CHECK(alice.pals_count == 2);
    CHECK(alice.last_online == "2h ago");
    CHECK(alice.guild_name == "Night Shift");

    const LevelPlayer& bob = players[1];
    CHECK(bob.uid == Guid::parse(kBob));
    CHECK(bob.name == "Bobby");
    CHECK(bob.level == 1);
    CHECK(bob.pals_count == 0);
    CHECK(bob.last_online == "Unknown");
    CHECK(bob.guild_name.empty());

    const auto later = extract_level_players(save, static_cast<std::uint64_t>(kNow + 48 * kHour));
    CHECK(later[0].last_online == "2d ago");
}

TEST_CASE("A save without world data has no players", "[world]") {
    const SaveFile save = read_save(player_save(kAlice));
    CHECK(extract_level_players(save).empty());
    CHECK_FALSE(find_player_instance_id(save, Guid::parse(kAlice)).has_value());
}

TEST_CASE("Player character instance ids are found by uid", "[world]") {
    const SaveFile save = read_save(level());
    CHECK(find_player_instance_id(save, Guid::parse(kAlice)) == Guid::parse(kAliceInstance));
    CHECK(find_player_instance_id(save, Guid::parse(kBob)) == Guid::parse(kBobInstance));
    CHECK_FALSE(find_player_instance_id(save, Guid::parse(kNobody)).has_value());
}

TEST_CASE("Player saves are patched to a new uid", "[world]") {
    SaveFile save = read_save(player_save(kAlice));
    CHECK(read_player_instance_id(save) == Guid::parse(kAliceInstance));

    CHECK(patch_player_save(save, Guid::parse(kAlice), Guid::parse(kBob)) == 2);
    CHECK(write_save(save) == player_save(kBob));
    CHECK(patch_player_save(save, Guid::parse(kAlice), Guid::parse(kBob)) == 0);
}

TEST_CASE("Swapping level players moves characters and memberships", "[world][swap]") {
    SaveFile save = read_save(level());
    const PlayerRef alice{Guid::parse(kAlice), Guid::parse(kAliceInstance)};
    const PlayerRef bob{Guid::parse(kBob), Guid::parse(kBobInstance)};

    // two character keys, member, handle, admin, two pal owners
    CHECK(swap_level_players(save, alice, bob) == 7);

    const auto players = extract_level_players(save);
    REQUIRE(players.size() == 2);
    CHECK(players[0].uid == Guid::parse(kBob));
    CHECK(players[0].name == "Alice");
    CHECK(players[0].level == 12);
    CHECK(players[0].pals_count == 2);
    CHECK(players[1].uid == Guid::parse(kAlice));
    CHECK(players[1].name == "Bobby");

    CHECK(find_player_instance_id(save, Guid::parse(kBob)) == Guid::parse(kAliceInstance));
    CHECK(swap_level_players(save, alice, alice) == 0);
}

TEST_CASE("Swapping back with the exchanged instances restores the level", "[world][swap]") {
    const Blob original = level();
    SaveFile save = read_save(original);
    swap_level_players(save, PlayerRef{Guid::parse(kAlice), Guid::parse(kAliceInstance)},
                       PlayerRef{Guid::parse(kBob), Guid::parse(kBobInstance)});
    swap_level_players(save, PlayerRef{Guid::parse(kAlice), Guid::parse(kBobInstance)},
                       PlayerRef{Guid::parse(kBob), Guid::parse(kAliceInstance)});
    CHECK(write_save(save) == original);
}

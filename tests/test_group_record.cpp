/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <catch2/catch.hpp>

#include "fixture_builder.h"
#include "gvas/gvas_error.h"
#include "gvas/gvas_group_record.h"
#include "gvas/gvas_reader.h"
#include "gvas/gvas_writer.h"

#include <string>
#include <vector>

using namespace palsav::gvas;
using namespace palsav::fixture;

namespace {
constexpr const char* kGroup = "6a000000-0000-0000-0000-000000000001";
constexpr const char* kAlice = "a1000000-0000-0000-0000-000000000001";
constexpr const char* kBob = "b0000000-0000-0000-0000-000000000002";

ErrorKind decode_error(const Blob& blob, GroupKind kind) {
    try {
        decode_group_record(blob, kind);
    } catch (const SaveError& e) {
        return e.kind();
    }
    FAIL("expected SaveError");
    return ErrorKind::InvalidTree;
}
}  // namespace

TEST_CASE("Guild records decode every field", "[group]") {
    const Blob blob = guild_blob(kGroup, {{kAlice, "11000000-0000-0000-0000-000000000001"}}, kAlice,
                                 {{kAlice, 1000, "Alice"}, {kBob, 2000, "Bob"}}, "Night Shift", Blob{0, 0, 0, 0});

    const GroupRecord rec = decode_group_record(blob, GroupKind::Guild);
    CHECK(rec.kind() == GroupKind::Guild);
    CHECK(rec.group_id == Guid::parse(kGroup));
    CHECK(rec.group_name == "Guild Group");
    REQUIRE(rec.handles.size() == 1);
    CHECK(rec.handles[0].guid == Guid::parse(kAlice));
    CHECK(rec.org_type == 1);

    const auto& g = std::get<GuildData>(rec.details);
    CHECK(g.leading_bytes == std::array<std::uint8_t, 4>{0xA1, 0xA2, 0xA3, 0xA4});
    REQUIRE(g.base_ids.size() == 1);
    CHECK(g.base_camp_level == 5);
    CHECK(g.guild_name == "Night Shift");
    CHECK(g.admin_player_uid == Guid::parse(kAlice));
    REQUIRE(g.players.size() == 2);
    CHECK(g.players[1].player_uid == Guid::parse(kBob));
    CHECK(g.players[1].info.last_online_real_time == 2000);
    CHECK(g.players[1].info.player_name == "Bob");
    CHECK(rec.trailing_bytes == Bytes{0, 0, 0, 0});

    CHECK(encode_group_record(rec) == blob);
}

TEST_CASE("Independent guild records decode the owner", "[group]") {
    const Blob blob = independent_guild_blob(kGroup, {}, kBob, "Bob");
    const GroupRecord rec = decode_group_record(blob, GroupKind::IndependentGuild);
    const auto& g = std::get<IndependentGuildData>(rec.details);
    CHECK(rec.org_type == 2);
    CHECK(g.player_uid == Guid::parse(kBob));
    CHECK(g.guild_name == "Solo Camp");
    CHECK(g.info.player_name == "Bob");
    CHECK(rec.trailing_bytes.empty());
    CHECK(encode_group_record(rec) == blob);
}

TEST_CASE("Organization records keep their trailer", "[group]") {
    Buf b = group_prefix(kGroup, "Neutral", {});
    b.u8(3);
    for (int i = 0; i < 12; i++) {
        b.u8(static_cast<std::uint8_t>(i));
    }
    const GroupRecord rec = decode_group_record(b.data, GroupKind::Organization);
    CHECK(std::holds_alternative<OrganizationData>(rec.details));
    CHECK(rec.org_type == 3);
    CHECK(rec.trailing_bytes.size() == kOrganizationTrailerSize);
    CHECK(encode_group_record(rec) == b.data);

    Buf shorter = group_prefix(kGroup, "Neutral", {});
    shorter.u8(3).u8(0).u8(0);
    CHECK(decode_error(shorter.data, GroupKind::Organization) == ErrorKind::SubRecord);

    GroupRecord bad = rec;
    bad.trailing_bytes.resize(4);
    try {
        encode_group_record(bad);
        FAIL("expected SaveError");
    } catch (const SaveError& e) {
        CHECK(e.kind() == ErrorKind::InvalidTree);
    }
}

TEST_CASE("Records of an unknown group type keep everything after the prefix", "[group]") {
    Buf b = group_prefix(kGroup, "Mystery", {{kAlice, kBob}});
    b.u8(9).u8(8).u8(7);
    const GroupRecord rec = decode_group_record(b.data, GroupKind::Unknown);
    CHECK(rec.kind() == GroupKind::Unknown);
    CHECK(rec.trailing_bytes == Bytes{9, 8, 7});
    CHECK(encode_group_record(rec) == b.data);
}

TEST_CASE("Truncated group records are sub-record errors", "[group]") {
    Blob blob = guild_blob(kGroup, {}, kAlice, {{kAlice, 1, "Alice"}}, "Night Shift");
    blob.resize(blob.size() - 3);
    CHECK(decode_error(blob, GroupKind::Guild) == ErrorKind::SubRecord);
    CHECK(decode_error(Blob{1, 2, 3}, GroupKind::Unknown) == ErrorKind::SubRecord);
}

TEST_CASE("Group kinds map to their enum names", "[group]") {
    CHECK(group_kind_from_enum("EPalGroupType::Guild") == GroupKind::Guild);
    CHECK(group_kind_from_enum("EPalGroupType::IndependentGuild") == GroupKind::IndependentGuild);
    CHECK(group_kind_from_enum("EPalGroupType::Organization") == GroupKind::Organization);
    CHECK(group_kind_from_enum("EPalGroupType::Neutral") == GroupKind::Unknown);
    CHECK(group_kind_enum_name(GroupKind::Guild) == "EPalGroupType::Guild");
}

TEST_CASE("GroupSaveDataMap blobs are decoded in place", "[group][tree]") {
    Buf entries;
    entries.raw(group_entry(kGroup, "EPalGroupType::Guild",
                            guild_blob(kGroup, {}, kAlice, {{kAlice, 10, "Alice"}}, "Night Shift")));
    entries.raw(group_entry("6a000000-0000-0000-0000-000000000002", "EPalGroupType::IndependentGuild",
                            independent_guild_blob("6a000000-0000-0000-0000-000000000002", {}, kBob, "Bob")));
    const Blob data = gvas_file(scope_prop(
        "worldSaveData", "PalWorldSaveData", map_prop("GroupSaveDataMap", "StructProperty", "StructProperty", 2, entries)
    ));

    std::vector<std::string> warnings;
    const SaveFile save = read_save(data, PolicyTable::defaults(), &warnings);
    CHECK(warnings.empty());
    const Property* map = find_path(save.properties, "worldSaveData.GroupSaveDataMap");
    REQUIRE(map != nullptr);
    const auto& m = std::get<MapProperty>(map->value);
    REQUIRE(m.entries.size() == 2);

    const auto& value = std::get<PropertyList>(std::get<StructValue>(m.entries[0].value));
    const auto& raw = std::get<ArrayProperty>(find_property(value, "RawData")->value);
    const auto& rec = std::get<GroupRecord>(raw.value);
    CHECK(std::get<GuildData>(rec.details).guild_name == "Night Shift");

    CHECK(write_save(save) == data);
}

TEST_CASE("A group blob that fails to decode stays raw with a warning", "[group][tree]") {
    const Blob broken = {1, 2, 3, 4, 5};
    Buf entries;
    entries.raw(group_entry(kGroup, "EPalGroupType::Guild", broken));
    const Blob data = gvas_file(map_prop("GroupSaveDataMap", "StructProperty", "StructProperty", 1, entries));

    std::vector<std::string> warnings;
    const SaveFile save = read_save(data, PolicyTable::defaults(), &warnings);
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].find("group record") != std::string::npos);

    const auto& m = std::get<MapProperty>(find_property(save.properties, "GroupSaveDataMap")->value);
    const auto& value = std::get<PropertyList>(std::get<StructValue>(m.entries[0].value));
    const auto& raw = std::get<ArrayProperty>(find_property(value, "RawData")->value);
    CHECK(std::get<Bytes>(raw.value) == broken);
    CHECK(write_save(save) == data);
}

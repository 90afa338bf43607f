/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_group_record.h"

#include "gvas/gvas_byte_reader.h"
#include "gvas/gvas_byte_writer.h"
#include "gvas/gvas_error.h"

#include <string>
#include <type_traits>

namespace palsav::gvas {
namespace {
std::vector<Guid> read_guid_list(ByteReader& r) {
    const std::uint32_t count = r.read_u32();
    if (count > r.remaining() / 16) {
        r.fail("guid list of " + std::to_string(count) + " entries exceeds record");
    }
    std::vector<Guid> out;
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        out.push_back(r.read_guid());
    }
    return out;
}

void write_guid_list(ByteWriter& w, const std::vector<Guid>& ids) {
    w.write_u32(static_cast<std::uint32_t>(ids.size()));
    for (const auto& id : ids) {
        w.write_guid(id);
    }
}

GuildData read_guild(ByteReader& r) {
    GuildData g;
    g.leading_bytes = r.read_array<4>();
    g.base_ids = read_guid_list(r);
    g.unknown_1 = r.read_i32();
    g.base_camp_level = r.read_i32();
    g.base_camp_point_ids = read_guid_list(r);
    g.guild_name = r.read_fstring();
    g.last_guild_name_modifier_player_uid = r.read_guid();
    g.unknown_2 = r.read_array<4>();
    g.admin_player_uid = r.read_guid();
    const std::uint32_t count = r.read_u32();
    if (count > r.remaining() / 28) {
        r.fail("guild member count " + std::to_string(count) + " exceeds record");
    }
    g.players.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        GuildMember m;
        m.player_uid = r.read_guid();
        m.info.last_online_real_time = r.read_i64();
        m.info.player_name = r.read_fstring();
        g.players.push_back(std::move(m));
    }
    return g;
}

IndependentGuildData read_independent_guild(ByteReader& r) {
    IndependentGuildData g;
    g.base_camp_level = r.read_i32();
    g.base_camp_point_ids = read_guid_list(r);
    g.guild_name = r.read_fstring();
    g.player_uid = r.read_guid();
    g.guild_name_2 = r.read_fstring();
    g.info.last_online_real_time = r.read_i64();
    g.info.player_name = r.read_fstring();
    return g;
}
}  // namespace

GroupRecord decode_group_record(std::span<const std::uint8_t> blob, GroupKind kind) {
    ByteReader r(blob);
    GroupRecord rec;
    try {
        rec.group_id = r.read_guid();
        rec.group_name = r.read_fstring();
        const std::uint32_t handles = r.read_u32();
        if (handles > r.remaining() / 32) {
            r.fail("handle count " + std::to_string(handles) + " exceeds record");
        }
        rec.handles.reserve(handles);
        for (std::uint32_t i = 0; i < handles; i++) {
            CharacterHandle h;
            h.guid = r.read_guid();
            h.instance_id = r.read_guid();
            rec.handles.push_back(h);
        }

        switch (kind) {
            case GroupKind::Guild:
                rec.org_type = r.read_u8();
                rec.details = read_guild(r);
                break;
            case GroupKind::IndependentGuild:
                rec.org_type = r.read_u8();
                rec.details = read_independent_guild(r);
                break;
            case GroupKind::Organization:
                rec.org_type = r.read_u8();
                if (r.remaining() < kOrganizationTrailerSize) {
                    r.fail("organization record needs " + std::to_string(kOrganizationTrailerSize)
                           + " trailing bytes");
                }
                rec.details = OrganizationData{};
                break;
            case GroupKind::Unknown:
                break;
        }
        rec.trailing_bytes = r.read_rest();
    } catch (const SaveError& e) {
        throw SaveError(ErrorKind::SubRecord, std::string("group record: ") + e.what());
    }
    return rec;
}

Bytes encode_group_record(const GroupRecord& record) {
    ByteWriter w;
    w.write_guid(record.group_id);
    w.write_fstring(record.group_name);
    w.write_u32(static_cast<std::uint32_t>(record.handles.size()));
    for (const auto& h : record.handles) {
        w.write_guid(h.guid);
        w.write_guid(h.instance_id);
    }

    std::visit(
        [&](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, GuildData>) {
                w.write_u8(record.org_type);
                w.write_bytes(d.leading_bytes);
                write_guid_list(w, d.base_ids);
                w.write_i32(d.unknown_1);
                w.write_i32(d.base_camp_level);
                write_guid_list(w, d.base_camp_point_ids);
                w.write_fstring(d.guild_name);
                w.write_guid(d.last_guild_name_modifier_player_uid);
                w.write_bytes(d.unknown_2);
                w.write_guid(d.admin_player_uid);
                w.write_u32(static_cast<std::uint32_t>(d.players.size()));
                for (const auto& m : d.players) {
                    w.write_guid(m.player_uid);
                    w.write_i64(m.info.last_online_real_time);
                    w.write_fstring(m.info.player_name);
                }
            } else if constexpr (std::is_same_v<T, IndependentGuildData>) {
                w.write_u8(record.org_type);
                w.write_i32(d.base_camp_level);
                write_guid_list(w, d.base_camp_point_ids);
                w.write_fstring(d.guild_name);
                w.write_guid(d.player_uid);
                w.write_fstring(d.guild_name_2);
                w.write_i64(d.info.last_online_real_time);
                w.write_fstring(d.info.player_name);
            } else if constexpr (std::is_same_v<T, OrganizationData>) {
                w.write_u8(record.org_type);
                if (record.trailing_bytes.size() < kOrganizationTrailerSize) {
                    throw SaveError(ErrorKind::InvalidTree, "organization record needs "
                                                                + std::to_string(kOrganizationTrailerSize)
                                                                + " trailing bytes");
                }
            }
        },
        record.details
    );
    w.write_bytes(record.trailing_bytes);
    return w.take();
}
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "world/level_players.h"

#include "gvas/gvas_identity_swap.h"

#include <algorithm>
#include <unordered_map>

namespace palsav::world {
using namespace palsav::gvas;

namespace {
struct GuildSeen {
    std::string player_name;
    std::int64_t last_online = 0;
    std::string guild_name;
};

struct CharacterSeen {
    std::uint32_t level = 0;
    std::string nick_name;
};

PropertyList* world_data(SaveFile& save) {
    Property* p = find_property(save.properties, "worldSaveData");
    return p ? struct_fields(*p) : nullptr;
}

const PropertyList* world_data(const SaveFile& save) {
    const Property* p = find_property(save.properties, "worldSaveData");
    return p ? struct_fields(*p) : nullptr;
}

const MapProperty* find_map(const PropertyList& scope, std::string_view name) {
    const Property* p = find_property(scope, name);
    return p ? std::get_if<MapProperty>(&p->value) : nullptr;
}

MapProperty* find_map(PropertyList& scope, std::string_view name) {
    Property* p = find_property(scope, name);
    return p ? std::get_if<MapProperty>(&p->value) : nullptr;
}

const PropertyList* bag_of(const Value& v) {
    const auto* sv = std::get_if<StructValue>(&v);
    return sv ? std::get_if<PropertyList>(sv) : nullptr;
}

PropertyList* bag_of(Value& v) {
    auto* sv = std::get_if<StructValue>(&v);
    return sv ? std::get_if<PropertyList>(sv) : nullptr;
}

std::optional<Guid> guid_field(const PropertyList& scope, std::string_view name) {
    const Property* p = find_property(scope, name);
    if (!p) {
        return std::nullopt;
    }
    if (auto g = guid_value(*p)) {
        return g;
    }
    if (const std::string* s = string_value(*p)) {
        return Guid::try_parse(*s);
    }
    return std::nullopt;
}

const CharacterRecord* character_of(const PropertyList& entry_value) {
    const Property* raw = find_property(entry_value, "RawData");
    const auto* array = raw ? std::get_if<ArrayProperty>(&raw->value) : nullptr;
    return array ? std::get_if<CharacterRecord>(&array->value) : nullptr;
}

// Parameters live in a "SaveParameter" struct inside the record's scope.
const PropertyList& save_parameters(const CharacterRecord& record) {
    if (const Property* p = find_property(record.object, "SaveParameter")) {
        if (const PropertyList* fields = struct_fields(*p)) {
            return *fields;
        }
    }
    return record.object;
}

std::uint32_t level_of(const PropertyList& params) {
    const Property* p = find_property(params, "Level");
    if (!p) {
        return 1;
    }
    if (const auto* b = std::get_if<ByteProperty>(&p->value)) {
        if (const auto* v = std::get_if<std::uint8_t>(&b->value)) {
            return *v;
        }
    } else if (const auto* i = std::get_if<IntProperty>(&p->value)) {
        return static_cast<std::uint32_t>(std::max(i->value, 0));
    }
    return 1;
}

std::uint64_t world_clock(const PropertyList& world) {
    const Property* p = find_path(world, "GameTimeSaveData.RealDateTimeTicks");
    if (!p) {
        return 0;
    }
    if (const auto* i = std::get_if<Int64Property>(&p->value)) {
        return static_cast<std::uint64_t>(std::max<std::int64_t>(i->value, 0));
    }
    if (const auto* u = std::get_if<UInt64Property>(&p->value)) {
        return u->value;
    }
    return 0;
}

struct GuidHash {
    std::size_t operator()(const Guid& g) const {
        std::size_t h = 1469598103934665603ULL;
        for (auto b : g.bytes) {
            h = (h ^ b) * 1099511628211ULL;
        }
        return h;
    }
};

bool replace_guid(Property* p, const Guid& from, const Guid& to) {
    if (!p) {
        return false;
    }
    auto* sp = std::get_if<StructProperty>(&p->value);
    auto* g = sp ? std::get_if<Guid>(&sp->value) : nullptr;
    if (!g || *g != from) {
        return false;
    }
    *g = to;
    return true;
}
}  // namespace

std::string player_save_filename(const Guid& uid) {
    std::string s = uid.to_string();
    s.erase(std::remove(s.begin(), s.end(), '-'), s.end());
    return s;
}

std::string format_last_seen(std::int64_t last_online_ticks, std::uint64_t now_ticks) {
    if (last_online_ticks <= 0) {
        return "Unknown";
    }
    const std::int64_t diff = static_cast<std::int64_t>(now_ticks) - last_online_ticks;
    if (diff < 0) {
        return "Online now";
    }
    const std::int64_t seconds = diff / kTicksPerSecond;
    if (seconds < 60) {
        return "Online now";
    }
    const std::int64_t minutes = seconds / 60;
    if (minutes < 60) {
        return std::to_string(minutes) + " min ago";
    }
    const std::int64_t hours = minutes / 60;
    if (hours < 24) {
        return std::to_string(hours) + "h ago";
    }
    return std::to_string(hours / 24) + "d ago";
}

std::vector<LevelPlayer> extract_level_players(const SaveFile& level, std::optional<std::uint64_t> now_ticks) {
    std::vector<LevelPlayer> out;
    const PropertyList* world = world_data(level);
    if (!world) {
        return out;
    }

    std::vector<Guid> order;
    std::unordered_map<Guid, GuildSeen, GuidHash> guilds;
    std::unordered_map<Guid, CharacterSeen, GuidHash> characters;
    std::unordered_map<Guid, std::size_t, GuidHash> pals;
    auto remember = [&](const Guid& uid) {
        if (std::find(order.begin(), order.end(), uid) == order.end()) {
            order.push_back(uid);
        }
    };

    if (const MapProperty* groups = find_map(*world, "GroupSaveDataMap")) {
        for (const auto& entry : groups->entries) {
            const PropertyList* bag = bag_of(entry.value);
            const Property* raw = bag ? find_property(*bag, "RawData") : nullptr;
            const auto* array = raw ? std::get_if<ArrayProperty>(&raw->value) : nullptr;
            const auto* record = array ? std::get_if<GroupRecord>(&array->value) : nullptr;
            const auto* guild = record ? std::get_if<GuildData>(&record->details) : nullptr;
            if (!guild) {
                continue;
            }
            for (const auto& member : guild->players) {
                guilds[member.player_uid] =
                    GuildSeen{member.info.player_name, member.info.last_online_real_time, guild->guild_name};
                remember(member.player_uid);
            }
        }
    }

    if (const MapProperty* cspm = find_map(*world, "CharacterSaveParameterMap")) {
        for (const auto& entry : cspm->entries) {
            const PropertyList* key = bag_of(entry.key);
            const PropertyList* value = bag_of(entry.value);
            const CharacterRecord* record = value ? character_of(*value) : nullptr;
            if (!record) {
                continue;
            }
            const PropertyList& params = save_parameters(*record);
            const Property* is_player = find_property(params, "IsPlayer");
            const auto* flag = is_player ? std::get_if<BoolProperty>(&is_player->value) : nullptr;
            if (flag && flag->value) {
                const Guid uid = key ? guid_field(*key, "PlayerUId").value_or(Guid{}) : Guid{};
                CharacterSeen seen;
                seen.level = level_of(params);
                if (const Property* nick = find_property(params, "NickName")) {
                    if (const std::string* s = string_value(*nick)) {
                        seen.nick_name = *s;
                    }
                }
                characters[uid] = std::move(seen);
                remember(uid);
            } else if (auto owner = guid_field(params, "OwnerPlayerUId")) {
                if (!owner->is_zero()) {
                    pals[*owner]++;
                }
            }
        }
    }

    const std::uint64_t now = now_ticks.value_or(world_clock(*world));
    for (const auto& uid : order) {
        LevelPlayer p;
        p.uid = uid;
        p.filename = player_save_filename(uid);
        p.last_online = "Unknown";
        std::string guild_player_name;
        if (auto it = guilds.find(uid); it != guilds.end()) {
            guild_player_name = it->second.player_name;
            p.guild_name = it->second.guild_name;
            p.last_online = format_last_seen(it->second.last_online, now);
        }
        const auto ch = characters.find(uid);
        if (!guild_player_name.empty()) {
            p.name = guild_player_name;
        } else if (ch != characters.end() && !ch->second.nick_name.empty()) {
            p.name = ch->second.nick_name;
        } else {
            p.name = p.filename;
        }
        p.level = ch != characters.end() ? ch->second.level : 0;
        if (auto it = pals.find(uid); it != pals.end()) {
            p.pals_count = it->second;
        }
        out.push_back(std::move(p));
    }
    return out;
}

std::optional<Guid> read_player_instance_id(const SaveFile& player_save) {
    const Property* p = find_path(player_save.properties, "SaveData.IndividualId.InstanceId");
    return p ? guid_value(*p) : std::nullopt;
}

std::optional<Guid> find_player_instance_id(const SaveFile& level, const Guid& uid) {
    const PropertyList* world = world_data(level);
    const MapProperty* cspm = world ? find_map(*world, "CharacterSaveParameterMap") : nullptr;
    if (!cspm) {
        return std::nullopt;
    }
    for (const auto& entry : cspm->entries) {
        const PropertyList* key = bag_of(entry.key);
        if (!key || guid_field(*key, "PlayerUId") != uid) {
            continue;
        }
        const PropertyList* value = bag_of(entry.value);
        const CharacterRecord* record = value ? character_of(*value) : nullptr;
        if (!record) {
            continue;
        }
        const Property* is_player = find_property(save_parameters(*record), "IsPlayer");
        const auto* flag = is_player ? std::get_if<BoolProperty>(&is_player->value) : nullptr;
        if (flag && flag->value) {
            return guid_field(*key, "InstanceId");
        }
    }
    return std::nullopt;
}

std::size_t patch_player_save(SaveFile& player_save, const Guid& old_uid, const Guid& new_uid) {
    std::size_t changed = 0;
    if (replace_guid(find_path(player_save.properties, "SaveData.PlayerUId"), old_uid, new_uid)) {
        changed++;
    }
    if (replace_guid(find_path(player_save.properties, "SaveData.IndividualId.PlayerUId"), old_uid, new_uid)) {
        changed++;
    }
    return changed;
}

std::size_t swap_level_players(SaveFile& level, const PlayerRef& a, const PlayerRef& b) {
    PropertyList* world = world_data(level);
    if (!world || a.uid == b.uid) {
        return 0;
    }
    std::size_t changed = 0;
    if (MapProperty* cspm = find_map(*world, "CharacterSaveParameterMap")) {
        for (auto& entry : cspm->entries) {
            PropertyList* key = bag_of(entry.key);
            if (!key) {
                continue;
            }
            const auto instance = guid_field(*key, "InstanceId");
            Property* uid = find_property(*key, "PlayerUId");
            if (!instance || !uid) {
                continue;
            }
            auto* sp = std::get_if<StructProperty>(&uid->value);
            auto* g = sp ? std::get_if<Guid>(&sp->value) : nullptr;
            if (!g) {
                continue;
            }
            if (*instance == a.instance_id) {
                *g = b.uid;
                changed++;
            } else if (*instance == b.instance_id) {
                *g = a.uid;
                changed++;
            }
        }
    }
    return changed + swap_identity(*world, a.uid, b.uid);
}
}  // namespace palsav::world

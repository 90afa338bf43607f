/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_json.h"

#include "gvas/gvas_error.h"

#include <cmath>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

namespace palsav::gvas {
namespace {
using Json = nlohmann::ordered_json;

[[noreturn]] void invalid(const std::string& what) {
    throw SaveError(ErrorKind::InvalidTree, what);
}

const Json& field(const Json& obj, const char* key) {
    if (!obj.is_object()) {
        invalid(std::string("expected an object holding \"") + key + "\"");
    }
    const auto it = obj.find(key);
    if (it == obj.end()) {
        invalid(std::string("missing \"") + key + "\"");
    }
    return *it;
}

template <typename T>
T get(const Json& obj, const char* key) {
    return field(obj, key).get<T>();
}

// JSON has no NaN or infinities; those are written as strings.
Json real_to_json(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v > 0 ? "Infinity" : "-Infinity";
    }
    return v;
}

double real_from_json(const Json& j) {
    if (j.is_string()) {
        const auto s = j.get<std::string>();
        if (s == "NaN") {
            return std::numeric_limits<double>::quiet_NaN();
        }
        if (s == "Infinity") {
            return std::numeric_limits<double>::infinity();
        }
        if (s == "-Infinity") {
            return -std::numeric_limits<double>::infinity();
        }
        invalid("not a number: " + s);
    }
    return j.get<double>();
}

double real(const Json& obj, const char* key) {
    return real_from_json(field(obj, key));
}

float real_f(const Json& obj, const char* key) {
    return static_cast<float>(real(obj, key));
}

Json bytes_to_json(const Bytes& bytes) {
    return base64_encode(bytes);
}

Bytes bytes_from_json(const Json& j) {
    return base64_decode(j.get<std::string>());
}

Guid guid(const Json& obj, const char* key) {
    return Guid::parse(get<std::string>(obj, key));
}

template <std::size_t N>
Json array_to_json(const std::array<std::uint8_t, N>& a) {
    Json out = Json::array();
    for (auto b : a) {
        out.push_back(b);
    }
    return out;
}

template <std::size_t N>
std::array<std::uint8_t, N> array_from_json(const Json& j) {
    if (!j.is_array() || j.size() != N) {
        invalid("expected " + std::to_string(N) + " bytes");
    }
    std::array<std::uint8_t, N> out{};
    for (std::size_t i = 0; i < N; i++) {
        out[i] = j[i].get<std::uint8_t>();
    }
    return out;
}

Json properties_to_json(const PropertyList& properties);
PropertyList properties_from_json(const Json& j);

Json vector3d_to_json(const Vector3d& v) {
    return Json{{"x", real_to_json(v.x)}, {"y", real_to_json(v.y)}, {"z", real_to_json(v.z)}};
}

Vector3d vector3d_from_json(const Json& j) {
    return Vector3d{real(j, "x"), real(j, "y"), real(j, "z")};
}

Json struct_to_json(const StructValue& value) {
    return std::visit(
        [](const auto& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, PropertyList>) {
                return properties_to_json(v);
            } else if constexpr (std::is_same_v<T, Guid>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, DateTime> || std::is_same_v<T, Timespan>) {
                return v.ticks;
            } else if constexpr (std::is_same_v<T, Vector3d>) {
                return vector3d_to_json(v);
            } else if constexpr (std::is_same_v<T, Vector4d>) {
                return Json{{"x", real_to_json(v.x)},
                            {"y", real_to_json(v.y)},
                            {"z", real_to_json(v.z)},
                            {"w", real_to_json(v.w)}};
            } else if constexpr (std::is_same_v<T, Vector2d> || std::is_same_v<T, Vector2f>) {
                return Json{{"x", real_to_json(v.x)}, {"y", real_to_json(v.y)}};
            } else if constexpr (std::is_same_v<T, Vector3f>) {
                return Json{{"x", real_to_json(v.x)}, {"y", real_to_json(v.y)}, {"z", real_to_json(v.z)}};
            } else if constexpr (std::is_same_v<T, IntVector>) {
                return Json{{"x", v.x}, {"y", v.y}, {"z", v.z}};
            } else if constexpr (std::is_same_v<T, IntPoint>) {
                return Json{{"x", v.x}, {"y", v.y}};
            } else if constexpr (std::is_same_v<T, LinearColor>) {
                return Json{{"r", real_to_json(v.r)},
                            {"g", real_to_json(v.g)},
                            {"b", real_to_json(v.b)},
                            {"a", real_to_json(v.a)}};
            } else if constexpr (std::is_same_v<T, Color>) {
                return Json{{"r", v.r}, {"g", v.g}, {"b", v.b}, {"a", v.a}};
            } else {
                static_assert(std::is_same_v<T, Box>);
                return Json{{"min", vector3d_to_json(v.min)}, {"max", vector3d_to_json(v.max)}, {"valid", v.valid}};
            }
        },
        value
    );
}

StructValue struct_from_json(std::string_view struct_type, const Json& j) {
    switch (layout_for(struct_type)) {
        case StructLayout::Generic:
            return properties_from_json(j);
        case StructLayout::Guid:
            return Guid::parse(j.get<std::string>());
        case StructLayout::DateTime:
            return DateTime{j.get<std::uint64_t>()};
        case StructLayout::Timespan:
            return Timespan{j.get<std::int64_t>()};
        case StructLayout::Vector3d:
            return vector3d_from_json(j);
        case StructLayout::Vector4d:
            return Vector4d{real(j, "x"), real(j, "y"), real(j, "z"), real(j, "w")};
        case StructLayout::Vector2d:
            return Vector2d{real(j, "x"), real(j, "y")};
        case StructLayout::Vector2f:
            return Vector2f{real_f(j, "x"), real_f(j, "y")};
        case StructLayout::Vector3f:
            return Vector3f{real_f(j, "x"), real_f(j, "y"), real_f(j, "z")};
        case StructLayout::IntVector:
            return IntVector{get<std::int32_t>(j, "x"), get<std::int32_t>(j, "y"), get<std::int32_t>(j, "z")};
        case StructLayout::IntPoint:
            return IntPoint{get<std::int32_t>(j, "x"), get<std::int32_t>(j, "y")};
        case StructLayout::LinearColor:
            return LinearColor{real_f(j, "r"), real_f(j, "g"), real_f(j, "b"), real_f(j, "a")};
        case StructLayout::Color:
            return Color{get<std::uint8_t>(j, "r"), get<std::uint8_t>(j, "g"), get<std::uint8_t>(j, "b"),
                         get<std::uint8_t>(j, "a")};
        case StructLayout::Box:
            return Box{vector3d_from_json(field(j, "min")), vector3d_from_json(field(j, "max")),
                       get<std::uint8_t>(j, "valid")};
    }
    return properties_from_json(j);
}

Json soft_object_to_json(const SoftObjectPath& v) {
    return Json{{"path", v.path}, {"sub_path", v.sub_path}};
}

SoftObjectPath soft_object_from_json(const Json& j) {
    return SoftObjectPath{get<std::string>(j, "path"), get<std::string>(j, "sub_path")};
}

Json value_to_json(const Value& value) {
    return std::visit(
        [](const auto& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                return real_to_json(v);
            } else if constexpr (std::is_same_v<T, Guid>) {
                return v.to_string();
            } else if constexpr (std::is_same_v<T, SoftObjectPath>) {
                return soft_object_to_json(v);
            } else if constexpr (std::is_same_v<T, StructValue>) {
                return struct_to_json(v);
            } else {
                return v;
            }
        },
        value
    );
}

template <typename T>
Value make_value(T v) {
    return Value(std::in_place_type<T>, std::move(v));
}

Value value_from_json(std::string_view type, std::string_view struct_type, const Json& j) {
    if (type == "StructProperty") {
        return make_value(struct_from_json(struct_type, j));
    }
    if (type == "EnumProperty" || type == "NameProperty" || type == "StrProperty" || type == "ObjectProperty") {
        return make_value(j.get<std::string>());
    }
    if (type == "Guid") {
        return make_value(Guid::parse(j.get<std::string>()));
    }
    if (type == "SoftObjectProperty") {
        return make_value(soft_object_from_json(j));
    }
    if (type == "ByteProperty") {
        return make_value(j.get<std::uint8_t>());
    }
    if (type == "BoolProperty") {
        return make_value(j.get<bool>());
    }
    if (type == "IntProperty") {
        return make_value(j.get<std::int32_t>());
    }
    if (type == "UInt32Property") {
        return make_value(j.get<std::uint32_t>());
    }
    if (type == "Int64Property") {
        return make_value(j.get<std::int64_t>());
    }
    if (type == "UInt64Property") {
        return make_value(j.get<std::uint64_t>());
    }
    if (type == "FloatProperty") {
        return make_value(static_cast<float>(real_from_json(j)));
    }
    if (type == "DoubleProperty") {
        return make_value(real_from_json(j));
    }
    return make_value(StructValue{properties_from_json(j)});
}

Json guid_list_to_json(const std::vector<Guid>& ids) {
    Json out = Json::array();
    for (const auto& id : ids) {
        out.push_back(id.to_string());
    }
    return out;
}

std::vector<Guid> guid_list_from_json(const Json& j) {
    std::vector<Guid> out;
    for (const auto& e : j) {
        out.push_back(Guid::parse(e.get<std::string>()));
    }
    return out;
}

Json player_info_to_json(const PlayerInfo& info) {
    return Json{{"last_online_real_time", info.last_online_real_time}, {"player_name", info.player_name}};
}

PlayerInfo player_info_from_json(const Json& j) {
    return PlayerInfo{get<std::int64_t>(j, "last_online_real_time"), get<std::string>(j, "player_name")};
}

Json group_to_json(const GroupRecord& g) {
    Json out = Json::object();
    out["kind"] = std::string(group_kind_enum_name(g.kind()));
    out["group_id"] = g.group_id.to_string();
    out["group_name"] = g.group_name;
    Json handles = Json::array();
    for (const auto& h : g.handles) {
        handles.push_back(Json{{"guid", h.guid.to_string()}, {"instance_id", h.instance_id.to_string()}});
    }
    out["handles"] = std::move(handles);
    if (g.kind() != GroupKind::Unknown) {
        out["org_type"] = g.org_type;
    }
    if (const auto* d = std::get_if<GuildData>(&g.details)) {
        Json guild = Json::object();
        guild["leading_bytes"] = array_to_json(d->leading_bytes);
        guild["base_ids"] = guid_list_to_json(d->base_ids);
        guild["unknown_1"] = d->unknown_1;
        guild["base_camp_level"] = d->base_camp_level;
        guild["base_camp_point_ids"] = guid_list_to_json(d->base_camp_point_ids);
        guild["guild_name"] = d->guild_name;
        guild["last_guild_name_modifier_player_uid"] = d->last_guild_name_modifier_player_uid.to_string();
        guild["unknown_2"] = array_to_json(d->unknown_2);
        guild["admin_player_uid"] = d->admin_player_uid.to_string();
        Json players = Json::array();
        for (const auto& m : d->players) {
            players.push_back(Json{{"player_uid", m.player_uid.to_string()}, {"player_info", player_info_to_json(m.info)}});
        }
        guild["players"] = std::move(players);
        out["guild"] = std::move(guild);
    } else if (const auto* ig = std::get_if<IndependentGuildData>(&g.details)) {
        Json guild = Json::object();
        guild["base_camp_level"] = ig->base_camp_level;
        guild["base_camp_point_ids"] = guid_list_to_json(ig->base_camp_point_ids);
        guild["guild_name"] = ig->guild_name;
        guild["player_uid"] = ig->player_uid.to_string();
        guild["guild_name_2"] = ig->guild_name_2;
        guild["player_info"] = player_info_to_json(ig->info);
        out["independent_guild"] = std::move(guild);
    }
    out["trailing_bytes"] = bytes_to_json(g.trailing_bytes);
    return out;
}

GroupRecord group_from_json(const Json& j) {
    GroupRecord g;
    const GroupKind kind = group_kind_from_enum(get<std::string>(j, "kind"));
    g.group_id = guid(j, "group_id");
    g.group_name = get<std::string>(j, "group_name");
    for (const auto& h : field(j, "handles")) {
        g.handles.push_back(CharacterHandle{guid(h, "guid"), guid(h, "instance_id")});
    }
    if (kind != GroupKind::Unknown) {
        g.org_type = get<std::uint8_t>(j, "org_type");
    }
    switch (kind) {
        case GroupKind::Guild: {
            const Json& src = field(j, "guild");
            GuildData d;
            d.leading_bytes = array_from_json<4>(field(src, "leading_bytes"));
            d.base_ids = guid_list_from_json(field(src, "base_ids"));
            d.unknown_1 = get<std::int32_t>(src, "unknown_1");
            d.base_camp_level = get<std::int32_t>(src, "base_camp_level");
            d.base_camp_point_ids = guid_list_from_json(field(src, "base_camp_point_ids"));
            d.guild_name = get<std::string>(src, "guild_name");
            d.last_guild_name_modifier_player_uid = guid(src, "last_guild_name_modifier_player_uid");
            d.unknown_2 = array_from_json<4>(field(src, "unknown_2"));
            d.admin_player_uid = guid(src, "admin_player_uid");
            for (const auto& m : field(src, "players")) {
                d.players.push_back(GuildMember{guid(m, "player_uid"), player_info_from_json(field(m, "player_info"))});
            }
            g.details = std::move(d);
            break;
        }
        case GroupKind::IndependentGuild: {
            const Json& src = field(j, "independent_guild");
            IndependentGuildData d;
            d.base_camp_level = get<std::int32_t>(src, "base_camp_level");
            d.base_camp_point_ids = guid_list_from_json(field(src, "base_camp_point_ids"));
            d.guild_name = get<std::string>(src, "guild_name");
            d.player_uid = guid(src, "player_uid");
            d.guild_name_2 = get<std::string>(src, "guild_name_2");
            d.info = player_info_from_json(field(src, "player_info"));
            g.details = std::move(d);
            break;
        }
        case GroupKind::Organization:
            g.details = OrganizationData{};
            break;
        case GroupKind::Unknown:
            break;
    }
    g.trailing_bytes = bytes_from_json(field(j, "trailing_bytes"));
    return g;
}

Json character_to_json(const CharacterRecord& c) {
    Json out = Json::object();
    out["object"] = properties_to_json(c.object);
    if (c.has_group_block) {
        out["reserved"] = array_to_json(c.reserved);
        out["group_id"] = c.group_id.to_string();
    }
    out["trailing_bytes"] = bytes_to_json(c.trailing_bytes);
    return out;
}

CharacterRecord character_from_json(const Json& j) {
    CharacterRecord c;
    c.object = properties_from_json(field(j, "object"));
    if (j.contains("group_id")) {
        c.has_group_block = true;
        c.reserved = array_from_json<4>(field(j, "reserved"));
        c.group_id = guid(j, "group_id");
    }
    c.trailing_bytes = bytes_from_json(field(j, "trailing_bytes"));
    return c;
}

Json array_value_to_json(const ArrayProperty& a) {
    return std::visit(
        [](const auto& v) -> Json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::vector<Value>>) {
                Json values = Json::array();
                for (const auto& e : v) {
                    values.push_back(value_to_json(e));
                }
                return Json{{"values", std::move(values)}};
            } else if constexpr (std::is_same_v<T, Bytes>) {
                return Json{{"bytes", bytes_to_json(v)}};
            } else if constexpr (std::is_same_v<T, RawArray>) {
                return Json{{"raw_array", Json{{"count", v.count}, {"raw", bytes_to_json(v.raw)}}}};
            } else if constexpr (std::is_same_v<T, StructArray>) {
                Json sa = Json::object();
                sa["prop_name"] = v.prop_name;
                sa["prop_type"] = v.prop_type;
                sa["type_name"] = v.type_name;
                sa["array_id"] = v.array_id.to_string();
                if (v.element_id) {
                    sa["element_id"] = v.element_id->to_string();
                }
                Json values = Json::array();
                for (const auto& e : v.values) {
                    values.push_back(struct_to_json(e));
                }
                sa["values"] = std::move(values);
                return Json{{"struct_array", std::move(sa)}};
            } else if constexpr (std::is_same_v<T, GroupRecord>) {
                return Json{{"group_record", group_to_json(v)}};
            } else {
                static_assert(std::is_same_v<T, CharacterRecord>);
                return Json{{"character_record", character_to_json(v)}};
            }
        },
        a.value
    );
}

ArrayValue array_value_from_json(const std::string& element_type, const Json& j) {
    if (j.contains("values")) {
        std::vector<Value> values;
        for (const auto& e : j.at("values")) {
            values.push_back(value_from_json(element_type, {}, e));
        }
        return values;
    }
    if (j.contains("bytes")) {
        return bytes_from_json(j.at("bytes"));
    }
    if (j.contains("raw_array")) {
        const Json& r = j.at("raw_array");
        return RawArray{get<std::uint32_t>(r, "count"), bytes_from_json(field(r, "raw"))};
    }
    if (j.contains("struct_array")) {
        const Json& src = j.at("struct_array");
        StructArray sa;
        sa.prop_name = get<std::string>(src, "prop_name");
        sa.prop_type = get<std::string>(src, "prop_type");
        sa.type_name = get<std::string>(src, "type_name");
        sa.array_id = guid(src, "array_id");
        if (src.contains("element_id")) {
            sa.element_id = guid(src, "element_id");
        }
        for (const auto& e : field(src, "values")) {
            sa.values.push_back(struct_from_json(sa.type_name, e));
        }
        return sa;
    }
    if (j.contains("group_record")) {
        return group_from_json(j.at("group_record"));
    }
    if (j.contains("character_record")) {
        return character_from_json(j.at("character_record"));
    }
    invalid("array property without elements");
}

Json property_to_json(const NamedProperty& np) {
    Json j = Json::object();
    j["name"] = np.name;
    j["type"] = type_name(np.property);
    if (np.property.id) {
        j["id"] = np.property.id->to_string();
    }
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, FloatProperty> || std::is_same_v<T, DoubleProperty>) {
                j["value"] = real_to_json(v.value);
            } else if constexpr (std::is_same_v<T, SoftObjectProperty>) {
                j["value"] = soft_object_to_json(v.value);
            } else if constexpr (std::is_same_v<T, EnumProperty>) {
                j["enum_type"] = v.enum_type;
                j["value"] = v.value;
            } else if constexpr (std::is_same_v<T, ByteProperty>) {
                j["enum_type"] = v.enum_type;
                std::visit([&](const auto& b) { j["value"] = b; }, v.value);
            } else if constexpr (std::is_same_v<T, TextProperty>) {
                j["raw"] = bytes_to_json(v.raw);
            } else if constexpr (std::is_same_v<T, StructProperty>) {
                j["struct_type"] = v.struct_type;
                j["struct_id"] = v.struct_id.to_string();
                j["value"] = struct_to_json(v.value);
            } else if constexpr (std::is_same_v<T, ArrayProperty>) {
                j["element_type"] = v.element_type;
                j["value"] = array_value_to_json(v);
            } else if constexpr (std::is_same_v<T, MapProperty>) {
                j["key_type"] = v.key_type;
                j["value_type"] = v.value_type;
                j["key_struct_type"] = v.key_struct_type;
                j["value_struct_type"] = v.value_struct_type;
                j["reserved"] = v.reserved;
                Json entries = Json::array();
                for (const auto& e : v.entries) {
                    entries.push_back(Json{{"key", value_to_json(e.key)}, {"value", value_to_json(e.value)}});
                }
                j["entries"] = std::move(entries);
            } else if constexpr (std::is_same_v<T, SetProperty>) {
                j["element_type"] = v.element_type;
                j["reserved"] = v.reserved;
                Json elements = Json::array();
                for (const auto& e : v.elements) {
                    elements.push_back(value_to_json(e));
                }
                j["elements"] = std::move(elements);
            } else if constexpr (std::is_same_v<T, OpaqueProperty>) {
                Json o = Json::object();
                o["reason"] = v.reason == OpaqueReason::Skipped ? "skipped" : "unknown_type";
                o["inner_type"] = v.inner_type;
                o["value_type"] = v.value_type;
                o["struct_id"] = v.struct_id.to_string();
                o["raw"] = bytes_to_json(v.raw);
                j["opaque"] = std::move(o);
            } else {
                j["value"] = v.value;
            }
        },
        np.property.value
    );
    return j;
}

template <typename T>
T number_property(const Json& j) {
    return T{get<decltype(T::value)>(j, "value")};
}

PropertyValue property_value_from_json(const std::string& type, const Json& j) {
    if (j.contains("opaque")) {
        const Json& src = j.at("opaque");
        OpaqueProperty o;
        o.type_name = type;
        o.reason = get<std::string>(src, "reason") == "skipped" ? OpaqueReason::Skipped : OpaqueReason::UnknownType;
        o.inner_type = get<std::string>(src, "inner_type");
        o.value_type = get<std::string>(src, "value_type");
        o.struct_id = guid(src, "struct_id");
        o.raw = bytes_from_json(field(src, "raw"));
        return o;
    }
    if (type == "IntProperty") {
        return number_property<IntProperty>(j);
    }
    if (type == "Int8Property") {
        return number_property<Int8Property>(j);
    }
    if (type == "Int16Property") {
        return number_property<Int16Property>(j);
    }
    if (type == "UInt16Property") {
        return number_property<UInt16Property>(j);
    }
    if (type == "UInt32Property") {
        return number_property<UInt32Property>(j);
    }
    if (type == "Int64Property") {
        return number_property<Int64Property>(j);
    }
    if (type == "UInt64Property") {
        return number_property<UInt64Property>(j);
    }
    if (type == "FixedPoint64Property") {
        return number_property<FixedPoint64Property>(j);
    }
    if (type == "FloatProperty") {
        return FloatProperty{real_f(j, "value")};
    }
    if (type == "DoubleProperty") {
        return DoubleProperty{real(j, "value")};
    }
    if (type == "BoolProperty") {
        return BoolProperty{get<bool>(j, "value")};
    }
    if (type == "StrProperty") {
        return StrProperty{get<std::string>(j, "value")};
    }
    if (type == "NameProperty") {
        return NameProperty{get<std::string>(j, "value")};
    }
    if (type == "ObjectProperty") {
        return ObjectProperty{get<std::string>(j, "value")};
    }
    if (type == "SoftObjectProperty") {
        return SoftObjectProperty{soft_object_from_json(field(j, "value"))};
    }
    if (type == "EnumProperty") {
        return EnumProperty{get<std::string>(j, "enum_type"), get<std::string>(j, "value")};
    }
    if (type == "ByteProperty") {
        ByteProperty b;
        b.enum_type = get<std::string>(j, "enum_type");
        const Json& v = field(j, "value");
        if (v.is_string()) {
            b.value = v.get<std::string>();
        } else {
            b.value = v.get<std::uint8_t>();
        }
        return b;
    }
    if (type == "TextProperty") {
        return TextProperty{bytes_from_json(field(j, "raw"))};
    }
    if (type == "StructProperty") {
        StructProperty s;
        s.struct_type = get<std::string>(j, "struct_type");
        s.struct_id = guid(j, "struct_id");
        s.value = struct_from_json(s.struct_type, field(j, "value"));
        return s;
    }
    if (type == "ArrayProperty") {
        ArrayProperty a;
        a.element_type = get<std::string>(j, "element_type");
        a.value = array_value_from_json(a.element_type, field(j, "value"));
        return a;
    }
    if (type == "MapProperty") {
        MapProperty m;
        m.key_type = get<std::string>(j, "key_type");
        m.value_type = get<std::string>(j, "value_type");
        m.key_struct_type = get<std::string>(j, "key_struct_type");
        m.value_struct_type = get<std::string>(j, "value_struct_type");
        m.reserved = get<std::uint32_t>(j, "reserved");
        for (const auto& e : field(j, "entries")) {
            m.entries.push_back(MapEntry{value_from_json(m.key_type, m.key_struct_type, field(e, "key")),
                                         value_from_json(m.value_type, m.value_struct_type, field(e, "value"))});
        }
        return m;
    }
    if (type == "SetProperty") {
        SetProperty s;
        s.element_type = get<std::string>(j, "element_type");
        s.reserved = get<std::uint32_t>(j, "reserved");
        for (const auto& e : field(j, "elements")) {
            s.elements.push_back(value_from_json(s.element_type, {}, e));
        }
        return s;
    }
    invalid("property type " + type + " needs an \"opaque\" payload");
}

Json properties_to_json(const PropertyList& properties) {
    Json out = Json::array();
    for (const auto& np : properties) {
        out.push_back(property_to_json(np));
    }
    return out;
}

PropertyList properties_from_json(const Json& j) {
    if (!j.is_array()) {
        invalid("property scope must be an array");
    }
    PropertyList out;
    out.reserve(j.size());
    for (const auto& e : j) {
        NamedProperty np;
        np.name = get<std::string>(e, "name");
        if (e.contains("id")) {
            np.property.id = guid(e, "id");
        }
        np.property.value = property_value_from_json(get<std::string>(e, "type"), e);
        out.push_back(std::move(np));
    }
    return out;
}

Json header_to_json(const GvasHeader& h) {
    Json out = Json::object();
    out["magic"] = h.magic;
    out["save_game_version"] = h.save_game_version;
    out["package_file_version_ue4"] = h.package_file_version_ue4;
    out["package_file_version_ue5"] = h.package_file_version_ue5;
    out["engine_version_major"] = h.engine_version_major;
    out["engine_version_minor"] = h.engine_version_minor;
    out["engine_version_patch"] = h.engine_version_patch;
    out["engine_version_changelist"] = h.engine_version_changelist;
    out["engine_version_branch"] = h.engine_version_branch;
    out["custom_version_format"] = h.custom_version_format;
    Json versions = Json::array();
    for (const auto& cv : h.custom_versions) {
        versions.push_back(Json{{"id", cv.id.to_string()}, {"version", cv.version}});
    }
    out["custom_versions"] = std::move(versions);
    out["save_game_class_name"] = h.save_game_class_name;
    return out;
}

GvasHeader header_from_json(const Json& j) {
    GvasHeader h;
    h.magic = get<std::int32_t>(j, "magic");
    h.save_game_version = get<std::int32_t>(j, "save_game_version");
    h.package_file_version_ue4 = get<std::int32_t>(j, "package_file_version_ue4");
    h.package_file_version_ue5 = get<std::int32_t>(j, "package_file_version_ue5");
    h.engine_version_major = get<std::uint16_t>(j, "engine_version_major");
    h.engine_version_minor = get<std::uint16_t>(j, "engine_version_minor");
    h.engine_version_patch = get<std::uint16_t>(j, "engine_version_patch");
    h.engine_version_changelist = get<std::uint32_t>(j, "engine_version_changelist");
    h.engine_version_branch = get<std::string>(j, "engine_version_branch");
    h.custom_version_format = get<std::int32_t>(j, "custom_version_format");
    for (const auto& cv : field(j, "custom_versions")) {
        h.custom_versions.push_back(CustomVersion{guid(cv, "id"), get<std::int32_t>(cv, "version")});
    }
    h.save_game_class_name = get<std::string>(j, "save_game_class_name");
    return h;
}
}  // namespace

nlohmann::ordered_json to_json(const SaveFile& save, std::optional<std::uint8_t> save_type) {
    Json doc = Json::object();
    if (save_type) {
        doc["save_type"] = *save_type;
    }
    doc["header"] = header_to_json(save.header);
    doc["properties"] = properties_to_json(save.properties);
    doc["trailer"] = bytes_to_json(save.trailer);
    return doc;
}

SaveFile save_from_json(const nlohmann::ordered_json& doc) {
    try {
        SaveFile save;
        save.header = header_from_json(field(doc, "header"));
        save.properties = properties_from_json(field(doc, "properties"));
        save.trailer = bytes_from_json(field(doc, "trailer"));
        return save;
    } catch (const nlohmann::json::exception& e) {
        throw SaveError(ErrorKind::InvalidTree, std::string("bad save document: ") + e.what());
    }
}

std::optional<std::uint8_t> save_type_of(const nlohmann::ordered_json& doc) {
    const auto it = doc.find("save_type");
    if (it == doc.end() || !it->is_number_unsigned()) {
        return std::nullopt;
    }
    return it->get<std::uint8_t>();
}
}  // namespace palsav::gvas

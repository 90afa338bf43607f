/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_primitives.h"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace palsav::gvas {
struct NamedProperty;
using PropertyList = std::vector<NamedProperty>;

// Fixed-layout structs. Field names follow the engine types they mirror.
struct Vector3d {
    double x = 0, y = 0, z = 0;
    bool operator==(const Vector3d&) const = default;
};

struct Vector4d {
    double x = 0, y = 0, z = 0, w = 0;
    bool operator==(const Vector4d&) const = default;
};

struct Vector2d {
    double x = 0, y = 0;
    bool operator==(const Vector2d&) const = default;
};

struct Vector2f {
    float x = 0, y = 0;
    bool operator==(const Vector2f&) const = default;
};

struct Vector3f {
    float x = 0, y = 0, z = 0;
    bool operator==(const Vector3f&) const = default;
};

struct IntVector {
    std::int32_t x = 0, y = 0, z = 0;
    bool operator==(const IntVector&) const = default;
};

struct IntPoint {
    std::int32_t x = 0, y = 0;
    bool operator==(const IntPoint&) const = default;
};

struct LinearColor {
    float r = 0, g = 0, b = 0, a = 0;
    bool operator==(const LinearColor&) const = default;
};

// Stored b, g, r, a on the wire.
struct Color {
    std::uint8_t r = 0, g = 0, b = 0, a = 0;
    bool operator==(const Color&) const = default;
};

struct DateTime {
    std::uint64_t ticks = 0;
    bool operator==(const DateTime&) const = default;
};

struct Timespan {
    std::int64_t ticks = 0;
    bool operator==(const Timespan&) const = default;
};

struct Box {
    Vector3d min;
    Vector3d max;
    std::uint8_t valid = 0;
    bool operator==(const Box&) const = default;
};

using StructValue = std::variant<
    PropertyList,
    Guid,
    DateTime,
    Timespan,
    Vector3d,
    Vector4d,
    Vector2d,
    Vector2f,
    Vector3f,
    IntVector,
    IntPoint,
    LinearColor,
    Color,
    Box>;

enum class StructLayout {
    Generic,
    Guid,
    DateTime,
    Timespan,
    Vector3d,
    Vector4d,
    Vector2d,
    Vector2f,
    Vector3f,
    IntVector,
    IntPoint,
    LinearColor,
    Color,
    Box,
};

// Layout used for a struct type name; anything not listed is a nested property scope.
StructLayout layout_for(std::string_view struct_type);
StructLayout layout_of(const StructValue& value);
StructValue default_struct_value(StructLayout layout);

struct SoftObjectPath {
    std::string path;
    std::string sub_path;
    bool operator==(const SoftObjectPath&) const = default;
};

/**
 * One element of an array, map or set. The container's element type tag
 * decides which alternative is legal; construct with explicit types.
 */
using Value = std::variant<
    bool,
    std::uint8_t,
    std::int32_t,
    std::uint32_t,
    std::int64_t,
    std::uint64_t,
    float,
    double,
    std::string,
    Guid,
    SoftObjectPath,
    StructValue>;

struct CharacterHandle {
    Guid guid;
    Guid instance_id;
    bool operator==(const CharacterHandle&) const = default;
};

struct PlayerInfo {
    std::int64_t last_online_real_time = 0;
    std::string player_name;
    bool operator==(const PlayerInfo&) const = default;
};

struct GuildMember {
    Guid player_uid;
    PlayerInfo info;
    bool operator==(const GuildMember&) const = default;
};

struct GuildData {
    std::array<std::uint8_t, 4> leading_bytes{};
    std::vector<Guid> base_ids;
    std::int32_t unknown_1 = 0;
    std::int32_t base_camp_level = 0;
    std::vector<Guid> base_camp_point_ids;
    std::string guild_name;
    Guid last_guild_name_modifier_player_uid;
    std::array<std::uint8_t, 4> unknown_2{};
    Guid admin_player_uid;
    std::vector<GuildMember> players;
    bool operator==(const GuildData&) const = default;
};

struct IndependentGuildData {
    std::int32_t base_camp_level = 0;
    std::vector<Guid> base_camp_point_ids;
    std::string guild_name;
    Guid player_uid;
    std::string guild_name_2;
    PlayerInfo info;
    bool operator==(const IndependentGuildData&) const = default;
};

// The twelve bytes that follow an organization's prefix stay in trailing_bytes.
struct OrganizationData {
    bool operator==(const OrganizationData&) const = default;
};

enum class GroupKind { Unknown, Guild, IndependentGuild, Organization };

GroupKind group_kind_from_enum(std::string_view group_type);
std::string_view group_kind_enum_name(GroupKind kind);

/**
 * Decoded group blob. The active alternative of `details` selects the layout
 * after the common prefix; `org_type` is only on the wire for the known kinds.
 * Bytes past the understood fields are kept in `trailing_bytes` unchanged.
 */
struct GroupRecord {
    Guid group_id;
    std::string group_name;
    std::vector<CharacterHandle> handles;
    std::uint8_t org_type = 0;
    std::variant<std::monostate, GuildData, IndependentGuildData, OrganizationData> details;
    Bytes trailing_bytes;

    GroupKind kind() const;
    bool operator==(const GroupRecord&) const = default;
};

/**
 * Decoded character blob: an embedded property scope, then either the
 * reserved/group-id block followed by trailing bytes, or (when fewer than 24
 * bytes followed the scope) only the verbatim trailer.
 */
struct CharacterRecord {
    PropertyList object;
    bool has_group_block = false;
    std::array<std::uint8_t, 4> reserved{};
    Guid group_id;
    Bytes trailing_bytes;
    bool operator==(const CharacterRecord&) const = default;
};

struct StructArray {
    std::string prop_name;
    std::string prop_type = "StructProperty";
    std::string type_name;
    Guid array_id;
    std::optional<Guid> element_id;
    std::vector<StructValue> values;
    bool operator==(const StructArray&) const = default;
};

// Elements of an element type the codec does not model.
struct RawArray {
    std::uint32_t count = 0;
    Bytes raw;
    bool operator==(const RawArray&) const = default;
};

using ArrayValue =
    std::variant<std::vector<Value>, Bytes, StructArray, RawArray, GroupRecord, CharacterRecord>;

struct IntProperty {
    std::int32_t value = 0;
    bool operator==(const IntProperty&) const = default;
};
struct Int8Property {
    std::int8_t value = 0;
    bool operator==(const Int8Property&) const = default;
};
struct Int16Property {
    std::int16_t value = 0;
    bool operator==(const Int16Property&) const = default;
};
struct UInt16Property {
    std::uint16_t value = 0;
    bool operator==(const UInt16Property&) const = default;
};
struct UInt32Property {
    std::uint32_t value = 0;
    bool operator==(const UInt32Property&) const = default;
};
struct Int64Property {
    std::int64_t value = 0;
    bool operator==(const Int64Property&) const = default;
};
struct UInt64Property {
    std::uint64_t value = 0;
    bool operator==(const UInt64Property&) const = default;
};
// 32-bit on the wire despite the name.
struct FixedPoint64Property {
    std::int32_t value = 0;
    bool operator==(const FixedPoint64Property&) const = default;
};
struct FloatProperty {
    float value = 0;
    bool operator==(const FloatProperty&) const = default;
};
struct DoubleProperty {
    double value = 0;
    bool operator==(const DoubleProperty&) const = default;
};
struct BoolProperty {
    bool value = false;
    bool operator==(const BoolProperty&) const = default;
};
struct StrProperty {
    std::string value;
    bool operator==(const StrProperty&) const = default;
};
struct NameProperty {
    std::string value;
    bool operator==(const NameProperty&) const = default;
};
struct ObjectProperty {
    std::string value;
    bool operator==(const ObjectProperty&) const = default;
};
struct SoftObjectProperty {
    SoftObjectPath value;
    bool operator==(const SoftObjectProperty&) const = default;
};
struct EnumProperty {
    std::string enum_type;
    std::string value;
    bool operator==(const EnumProperty&) const = default;
};
// enum_type "None" carries a raw byte, anything else an enum value name.
struct ByteProperty {
    std::string enum_type = "None";
    std::variant<std::uint8_t, std::string> value;
    bool operator==(const ByteProperty&) const = default;
};
struct TextProperty {
    Bytes raw;
    bool operator==(const TextProperty&) const = default;
};
struct StructProperty {
    std::string struct_type;
    Guid struct_id;
    StructValue value;
    bool operator==(const StructProperty&) const = default;
};
struct ArrayProperty {
    std::string element_type;
    ArrayValue value;
    bool operator==(const ArrayProperty&) const = default;
};
struct MapEntry {
    Value key;
    Value value;
    bool operator==(const MapEntry&) const = default;
};
struct MapProperty {
    std::string key_type;
    std::string value_type;
    // Only meaningful when the matching type is StructProperty.
    std::string key_struct_type;
    std::string value_struct_type;
    std::uint32_t reserved = 0;
    std::vector<MapEntry> entries;
    bool operator==(const MapProperty&) const = default;
};
struct SetProperty {
    std::string element_type;
    std::uint32_t reserved = 0;
    std::vector<Value> elements;
    bool operator==(const SetProperty&) const = default;
};

enum class OpaqueReason { Skipped, UnknownType };

/**
 * Payload kept as raw bytes. The metadata written before the payload depends
 * on `type_name`: ArrayProperty/SetProperty carry `inner_type`, MapProperty
 * carries `inner_type` and `value_type`, StructProperty carries `inner_type`
 * and `struct_id`; every other type carries nothing.
 */
struct OpaqueProperty {
    std::string type_name;
    std::string inner_type;
    std::string value_type;
    Guid struct_id;
    Bytes raw;
    OpaqueReason reason = OpaqueReason::Skipped;
    bool operator==(const OpaqueProperty&) const = default;
};

using PropertyValue = std::variant<
    IntProperty,
    Int8Property,
    Int16Property,
    UInt16Property,
    UInt32Property,
    Int64Property,
    UInt64Property,
    FixedPoint64Property,
    FloatProperty,
    DoubleProperty,
    BoolProperty,
    StrProperty,
    NameProperty,
    ObjectProperty,
    SoftObjectProperty,
    EnumProperty,
    ByteProperty,
    TextProperty,
    StructProperty,
    ArrayProperty,
    MapProperty,
    SetProperty,
    OpaqueProperty>;

struct Property {
    std::optional<Guid> id;
    PropertyValue value;
    bool operator==(const Property&) const = default;
};

struct NamedProperty {
    std::string name;
    Property property;
    bool operator==(const NamedProperty&) const = default;
};

struct CustomVersion {
    Guid id;
    std::int32_t version = 0;
    bool operator==(const CustomVersion&) const = default;
};

constexpr std::int32_t kGvasMagic = 0x53415647;  // "GVAS"

struct GvasHeader {
    std::int32_t magic = kGvasMagic;
    std::int32_t save_game_version = 3;
    std::int32_t package_file_version_ue4 = 0;
    std::int32_t package_file_version_ue5 = 0;
    std::uint16_t engine_version_major = 0;
    std::uint16_t engine_version_minor = 0;
    std::uint16_t engine_version_patch = 0;
    std::uint32_t engine_version_changelist = 0;
    std::string engine_version_branch;
    std::int32_t custom_version_format = 3;
    std::vector<CustomVersion> custom_versions;
    std::string save_game_class_name;
    bool operator==(const GvasHeader&) const = default;
};

struct SaveFile {
    GvasHeader header;
    PropertyList properties;
    Bytes trailer;
    bool operator==(const SaveFile&) const = default;
};

// Wire type tag of a property ("IntProperty", ...); opaque nodes report their stored tag.
std::string type_name(const Property& property);

const Property* find_property(const PropertyList& list, std::string_view name);
Property* find_property(PropertyList& list, std::string_view name);

// Follows dotted names through nested struct scopes, e.g. "SaveData.IndividualId.InstanceId".
const Property* find_path(const PropertyList& list, std::string_view dotted);
Property* find_path(PropertyList& list, std::string_view dotted);

const PropertyList* struct_fields(const Property& property);
PropertyList* struct_fields(Property& property);

std::optional<Guid> guid_value(const Property& property);
// Str, Name, Object and Enum values.
const std::string* string_value(const Property& property);
}  // namespace palsav::gvas

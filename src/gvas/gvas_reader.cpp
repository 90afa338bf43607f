/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_reader.h"

#include "gvas/gvas_character_record.h"
#include "gvas/gvas_group_record.h"

#include <utility>

namespace palsav::gvas {
namespace {
struct DepthGuard {
    explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }
    int& depth_;
};

constexpr std::string_view kScalarElementTypes[] = {
    "EnumProperty", "NameProperty", "StrProperty", "ObjectProperty", "Guid", "SoftObjectProperty",
    "ByteProperty", "BoolProperty", "IntProperty", "UInt32Property", "Int64Property", "UInt64Property",
    "FloatProperty", "DoubleProperty",
};

bool is_scalar_element(std::string_view type) {
    for (auto t : kScalarElementTypes) {
        if (t == type) {
            return true;
        }
    }
    return false;
}
}  // namespace

PropertyReader::PropertyReader(std::span<const std::uint8_t> data,
                               const PolicyTable& policy,
                               std::vector<std::string>* warnings,
                               int depth)
    : reader_(data), policy_(policy), warnings_(warnings), depth_(depth) {}

void PropertyReader::warn(std::string message) {
    if (warnings_) {
        warnings_->push_back(std::move(message));
    }
}

GvasHeader PropertyReader::read_header() {
    GvasHeader h;
    h.magic = reader_.read_i32();
    if (h.magic != kGvasMagic) {
        const auto m = static_cast<std::uint32_t>(h.magic);
        const std::uint8_t wire[4] = {static_cast<std::uint8_t>(m), static_cast<std::uint8_t>(m >> 8),
                                      static_cast<std::uint8_t>(m >> 16), static_cast<std::uint8_t>(m >> 24)};
        throw SaveError(ErrorKind::MalformedEnvelope, "bad GVAS magic " + to_hex(wire));
    }
    h.save_game_version = reader_.read_i32();
    h.package_file_version_ue4 = reader_.read_i32();
    h.package_file_version_ue5 = reader_.read_i32();
    h.engine_version_major = reader_.read_u16();
    h.engine_version_minor = reader_.read_u16();
    h.engine_version_patch = reader_.read_u16();
    h.engine_version_changelist = reader_.read_u32();
    h.engine_version_branch = reader_.read_fstring();
    h.custom_version_format = reader_.read_i32();
    const std::uint32_t count = reader_.read_u32();
    if (count > reader_.remaining() / 20) {
        reader_.fail("custom version count " + std::to_string(count) + " exceeds input");
    }
    h.custom_versions.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        CustomVersion cv;
        cv.id = reader_.read_guid();
        cv.version = reader_.read_i32();
        h.custom_versions.push_back(cv);
    }
    h.save_game_class_name = reader_.read_fstring();
    return h;
}

PropertyList PropertyReader::read_properties(const std::string& path) {
    if (depth_ >= kMaxNestingDepth) {
        throw SaveError(ErrorKind::MalformedTree,
                        "property scopes nested deeper than " + std::to_string(kMaxNestingDepth) + " at offset "
                            + std::to_string(reader_.position()),
                        path);
    }
    DepthGuard guard(depth_);

    PropertyList out;
    while (true) {
        std::string name = reader_.read_fstring();
        if (name.empty() || name == "None") {
            break;
        }
        const std::string type = reader_.read_fstring();
        const std::uint64_t size = reader_.read_u64();
        const std::string child = path + "." + name;
        try {
            out.push_back(NamedProperty{std::move(name), read_property(type, size, child)});
        } catch (const SaveError& e) {
            if (!e.path().empty()) {
                throw;
            }
            throw SaveError(e.kind(), std::string(e.what()) + " in " + child + " (" + type + ")", child);
        }
    }
    return out;
}

Property PropertyReader::read_property(const std::string& type, std::uint64_t size, const std::string& path) {
    // Bool values live in the tag itself; skipping them would lose the value.
    if (type != "BoolProperty" && policy_.should_skip(path)) {
        return read_opaque(type, size, OpaqueReason::Skipped);
    }

    Property p;
    if (type == "IntProperty") {
        p.id = reader_.read_optional_guid();
        p.value = IntProperty{reader_.read_i32()};
    } else if (type == "Int8Property") {
        p.id = reader_.read_optional_guid();
        p.value = Int8Property{reader_.read_i8()};
    } else if (type == "Int16Property") {
        p.id = reader_.read_optional_guid();
        p.value = Int16Property{reader_.read_i16()};
    } else if (type == "UInt16Property") {
        p.id = reader_.read_optional_guid();
        p.value = UInt16Property{reader_.read_u16()};
    } else if (type == "UInt32Property") {
        p.id = reader_.read_optional_guid();
        p.value = UInt32Property{reader_.read_u32()};
    } else if (type == "Int64Property") {
        p.id = reader_.read_optional_guid();
        p.value = Int64Property{reader_.read_i64()};
    } else if (type == "UInt64Property") {
        p.id = reader_.read_optional_guid();
        p.value = UInt64Property{reader_.read_u64()};
    } else if (type == "FixedPoint64Property") {
        p.id = reader_.read_optional_guid();
        p.value = FixedPoint64Property{reader_.read_i32()};
    } else if (type == "FloatProperty") {
        p.id = reader_.read_optional_guid();
        p.value = FloatProperty{reader_.read_f32()};
    } else if (type == "DoubleProperty") {
        p.id = reader_.read_optional_guid();
        p.value = DoubleProperty{reader_.read_f64()};
    } else if (type == "BoolProperty") {
        const bool v = reader_.read_u8() != 0;
        p.id = reader_.read_optional_guid();
        p.value = BoolProperty{v};
    } else if (type == "StrProperty") {
        p.id = reader_.read_optional_guid();
        p.value = StrProperty{reader_.read_fstring()};
    } else if (type == "NameProperty") {
        p.id = reader_.read_optional_guid();
        p.value = NameProperty{reader_.read_fstring()};
    } else if (type == "ObjectProperty") {
        p.id = reader_.read_optional_guid();
        p.value = ObjectProperty{reader_.read_fstring()};
    } else if (type == "SoftObjectProperty") {
        p.id = reader_.read_optional_guid();
        SoftObjectProperty so;
        so.value.path = reader_.read_fstring();
        so.value.sub_path = reader_.read_fstring();
        p.value = std::move(so);
    } else if (type == "EnumProperty") {
        EnumProperty e;
        e.enum_type = reader_.read_fstring();
        p.id = reader_.read_optional_guid();
        e.value = reader_.read_fstring();
        p.value = std::move(e);
    } else if (type == "ByteProperty") {
        ByteProperty b;
        b.enum_type = reader_.read_fstring();
        p.id = reader_.read_optional_guid();
        if (b.enum_type == "None") {
            b.value = reader_.read_u8();
        } else {
            b.value = reader_.read_fstring();
        }
        p.value = std::move(b);
    } else if (type == "TextProperty") {
        p.id = reader_.read_optional_guid();
        p.value = TextProperty{reader_.read_bytes(static_cast<std::size_t>(size))};
    } else if (type == "StructProperty") {
        StructProperty s;
        s.struct_type = reader_.read_fstring();
        s.struct_id = reader_.read_guid();
        p.id = reader_.read_optional_guid();
        s.value = read_struct_value(s.struct_type, path);
        p.value = std::move(s);
    } else if (type == "ArrayProperty") {
        return read_array(size, path);
    } else if (type == "MapProperty") {
        return read_map(path);
    } else if (type == "SetProperty") {
        return read_set(path);
    } else {
        return read_opaque(type, size, OpaqueReason::UnknownType);
    }
    return p;
}

Property PropertyReader::read_opaque(const std::string& type, std::uint64_t size, OpaqueReason reason) {
    OpaqueProperty o;
    o.type_name = type;
    o.reason = reason;
    if (type == "ArrayProperty" || type == "SetProperty") {
        o.inner_type = reader_.read_fstring();
    } else if (type == "MapProperty") {
        o.inner_type = reader_.read_fstring();
        o.value_type = reader_.read_fstring();
    } else if (type == "StructProperty") {
        o.inner_type = reader_.read_fstring();
        o.struct_id = reader_.read_guid();
    }
    Property p;
    p.id = reader_.read_optional_guid();
    if (size > reader_.remaining()) {
        reader_.fail("property size " + std::to_string(size) + " exceeds input");
    }
    o.raw = reader_.read_bytes(static_cast<std::size_t>(size));
    p.value = std::move(o);
    return p;
}

StructValue PropertyReader::read_struct_value(std::string_view struct_type, const std::string& path) {
    switch (layout_for(struct_type)) {
        case StructLayout::Generic:
            return read_properties(path);
        case StructLayout::Guid:
            return reader_.read_guid();
        case StructLayout::DateTime:
            return DateTime{reader_.read_u64()};
        case StructLayout::Timespan:
            return Timespan{reader_.read_i64()};
        case StructLayout::Vector3d: {
            Vector3d v;
            v.x = reader_.read_f64();
            v.y = reader_.read_f64();
            v.z = reader_.read_f64();
            return v;
        }
        case StructLayout::Vector4d: {
            Vector4d v;
            v.x = reader_.read_f64();
            v.y = reader_.read_f64();
            v.z = reader_.read_f64();
            v.w = reader_.read_f64();
            return v;
        }
        case StructLayout::Vector2d: {
            Vector2d v;
            v.x = reader_.read_f64();
            v.y = reader_.read_f64();
            return v;
        }
        case StructLayout::Vector2f: {
            Vector2f v;
            v.x = reader_.read_f32();
            v.y = reader_.read_f32();
            return v;
        }
        case StructLayout::Vector3f: {
            Vector3f v;
            v.x = reader_.read_f32();
            v.y = reader_.read_f32();
            v.z = reader_.read_f32();
            return v;
        }
        case StructLayout::IntVector: {
            IntVector v;
            v.x = reader_.read_i32();
            v.y = reader_.read_i32();
            v.z = reader_.read_i32();
            return v;
        }
        case StructLayout::IntPoint: {
            IntPoint v;
            v.x = reader_.read_i32();
            v.y = reader_.read_i32();
            return v;
        }
        case StructLayout::LinearColor: {
            LinearColor c;
            c.r = reader_.read_f32();
            c.g = reader_.read_f32();
            c.b = reader_.read_f32();
            c.a = reader_.read_f32();
            return c;
        }
        case StructLayout::Color: {
            Color c;
            c.b = reader_.read_u8();
            c.g = reader_.read_u8();
            c.r = reader_.read_u8();
            c.a = reader_.read_u8();
            return c;
        }
        case StructLayout::Box: {
            Box b;
            b.min.x = reader_.read_f64();
            b.min.y = reader_.read_f64();
            b.min.z = reader_.read_f64();
            b.max.x = reader_.read_f64();
            b.max.y = reader_.read_f64();
            b.max.z = reader_.read_f64();
            b.valid = reader_.read_u8();
            return b;
        }
    }
    return read_properties(path);
}

std::optional<Value> PropertyReader::read_scalar(std::string_view type) {
    if (type == "EnumProperty" || type == "NameProperty" || type == "StrProperty" || type == "ObjectProperty") {
        return Value{reader_.read_fstring()};
    }
    if (type == "Guid") {
        return Value{reader_.read_guid()};
    }
    if (type == "SoftObjectProperty") {
        SoftObjectPath so;
        so.path = reader_.read_fstring();
        so.sub_path = reader_.read_fstring();
        return Value{std::move(so)};
    }
    if (type == "ByteProperty") {
        return Value{reader_.read_u8()};
    }
    if (type == "BoolProperty") {
        return Value{reader_.read_u8() != 0};
    }
    if (type == "IntProperty") {
        return Value{reader_.read_i32()};
    }
    if (type == "UInt32Property") {
        return Value{reader_.read_u32()};
    }
    if (type == "Int64Property") {
        return Value{reader_.read_i64()};
    }
    if (type == "UInt64Property") {
        return Value{reader_.read_u64()};
    }
    if (type == "FloatProperty") {
        return Value{reader_.read_f32()};
    }
    if (type == "DoubleProperty") {
        return Value{reader_.read_f64()};
    }
    return std::nullopt;
}

Value PropertyReader::read_element(std::string_view type, const std::string& struct_hint, const std::string& path) {
    if (type == "StructProperty") {
        return Value{read_struct_value(struct_hint, path)};
    }
    if (auto v = read_scalar(type)) {
        return std::move(*v);
    }
    // Element types without a fixed encoding are written as property scopes.
    return Value{StructValue{read_properties(path)}};
}

StructArray PropertyReader::read_struct_array(std::uint32_t count, const std::string& path) {
    StructArray sa;
    sa.prop_name = reader_.read_fstring();
    sa.prop_type = reader_.read_fstring();
    const std::uint64_t element_bytes = reader_.read_u64();
    sa.type_name = reader_.read_fstring();
    sa.array_id = reader_.read_guid();
    sa.element_id = reader_.read_optional_guid();

    const std::size_t start = reader_.position();
    if (count > reader_.remaining()) {
        reader_.fail("struct array count " + std::to_string(count) + " exceeds input");
    }
    sa.values.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        sa.values.push_back(read_struct_value(sa.type_name, path));
    }
    const std::size_t consumed = reader_.position() - start;
    if (consumed != element_bytes) {
        warn(path + ": struct array declares " + std::to_string(element_bytes) + " element bytes, read "
             + std::to_string(consumed));
    }
    return sa;
}

Property PropertyReader::read_array(std::uint64_t size, const std::string& path) {
    ArrayProperty a;
    a.element_type = reader_.read_fstring();
    Property p;
    p.id = reader_.read_optional_guid();

    if (size < 4) {
        reader_.fail("array payload of " + std::to_string(size) + " bytes has no element count");
    }
    const std::uint32_t count = reader_.read_u32();
    if (a.element_type == "StructProperty") {
        a.value = read_struct_array(count, path);
    } else if (a.element_type == "ByteProperty") {
        const bool character = policy_.decoder_for(path) == DomainDecoder::CharacterRecord;
        if (size == static_cast<std::uint64_t>(count) + 4) {
            if (character) {
                a.value = decode_character_blob(reader_.read_bytes(count), path);
            } else {
                a.value = reader_.read_bytes(count);
            }
        } else {
            if (character) {
                warn(path + ": byte array declares " + std::to_string(count) + " elements in " +
                     std::to_string(size - 4) + " bytes, kept raw");
            }
            a.value = RawArray{count, reader_.read_bytes(static_cast<std::size_t>(size - 4))};
        }
    } else if (is_scalar_element(a.element_type)) {
        if (count > reader_.remaining()) {
            reader_.fail("array count " + std::to_string(count) + " exceeds input");
        }
        std::vector<Value> values;
        values.reserve(count);
        for (std::uint32_t i = 0; i < count; i++) {
            values.push_back(*read_scalar(a.element_type));
        }
        a.value = std::move(values);
    } else {
        a.value = RawArray{count, reader_.read_bytes(static_cast<std::size_t>(size - 4))};
    }
    p.value = std::move(a);
    return p;
}

Property PropertyReader::read_map(const std::string& path) {
    MapProperty m;
    m.key_type = reader_.read_fstring();
    m.value_type = reader_.read_fstring();
    Property p;
    p.id = reader_.read_optional_guid();
    m.reserved = reader_.read_u32();
    const std::uint32_t count = reader_.read_u32();

    const std::string key_path = path + ".Key";
    const std::string value_path = path + ".Value";
    if (m.key_type == "StructProperty") {
        m.key_struct_type = policy_.struct_hint(key_path).value_or("");
    }
    if (m.value_type == "StructProperty") {
        m.value_struct_type = policy_.struct_hint(value_path).value_or("");
    }
    if (count > reader_.remaining()) {
        reader_.fail("map count " + std::to_string(count) + " exceeds input");
    }
    m.entries.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        MapEntry e;
        e.key = read_element(m.key_type, m.key_struct_type, key_path);
        e.value = read_element(m.value_type, m.value_struct_type, value_path);
        m.entries.push_back(std::move(e));
    }
    if (policy_.decoder_for(path) == DomainDecoder::GroupRecords) {
        decode_group_map(m, path);
    }
    p.value = std::move(m);
    return p;
}

Property PropertyReader::read_set(const std::string& path) {
    SetProperty s;
    s.element_type = reader_.read_fstring();
    Property p;
    p.id = reader_.read_optional_guid();
    s.reserved = reader_.read_u32();
    const std::uint32_t count = reader_.read_u32();
    if (count > reader_.remaining()) {
        reader_.fail("set count " + std::to_string(count) + " exceeds input");
    }
    s.elements.reserve(count);
    for (std::uint32_t i = 0; i < count; i++) {
        s.elements.push_back(read_element(s.element_type, "", path));
    }
    p.value = std::move(s);
    return p;
}

ArrayValue PropertyReader::decode_character_blob(Bytes blob, const std::string& path) {
    try {
        return decode_character_record(blob, policy_, warnings_, depth_);
    } catch (const SaveError& e) {
        warn(path + ": character record kept raw: " + e.what());
    }
    return blob;
}

void PropertyReader::decode_group_map(MapProperty& map, const std::string& path) {
    for (auto& entry : map.entries) {
        auto* sv = std::get_if<StructValue>(&entry.value);
        auto* bag = sv ? std::get_if<PropertyList>(sv) : nullptr;
        if (!bag) {
            continue;
        }
        GroupKind kind = GroupKind::Unknown;
        if (const Property* gt = find_property(*bag, "GroupType")) {
            if (const std::string* name = string_value(*gt)) {
                kind = group_kind_from_enum(*name);
            }
        }
        Property* raw = find_property(*bag, "RawData");
        auto* array = raw ? std::get_if<ArrayProperty>(&raw->value) : nullptr;
        auto* blob = array ? std::get_if<Bytes>(&array->value) : nullptr;
        if (!blob || blob->empty()) {
            continue;
        }
        try {
            array->value = decode_group_record(*blob, kind);
        } catch (const SaveError& e) {
            warn(path + ".Value.RawData: group record kept raw: " + e.what());
        }
    }
}

SaveFile read_save(std::span<const std::uint8_t> gvas, const PolicyTable& policy, std::vector<std::string>* warnings) {
    PropertyReader reader(gvas, policy, warnings);
    SaveFile save;
    save.header = reader.read_header();
    save.properties = reader.read_properties("");
    save.trailer = reader.read_trailer();
    return save;
}
}  // namespace palsav::gvas

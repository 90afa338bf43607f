/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_writer.h"

#include "gvas/gvas_character_record.h"
#include "gvas/gvas_error.h"
#include "gvas/gvas_group_record.h"
#include "gvas/gvas_reader.h"

#include <limits>
#include <string>
#include <type_traits>

namespace palsav::gvas {
namespace {
struct ScopeDepth {
    explicit ScopeDepth(int& depth) : depth_(depth) { ++depth_; }
    ~ScopeDepth() { --depth_; }
    int& depth_;
};

[[noreturn]] void invalid(const std::string& what) {
    throw SaveError(ErrorKind::InvalidTree, what);
}

template <typename T>
const T& expect(const Value& value, std::string_view type) {
    const T* v = std::get_if<T>(&value);
    if (!v) {
        invalid("element of type " + std::string(type) + " holds an incompatible value");
    }
    return *v;
}

std::uint32_t checked_count(std::size_t n, std::string_view what) {
    if (n > std::numeric_limits<std::uint32_t>::max()) {
        invalid(std::string(what) + " has too many elements");
    }
    return static_cast<std::uint32_t>(n);
}
}  // namespace

void PropertyWriter::write_header(const GvasHeader& h) {
    out_.write_i32(h.magic);
    out_.write_i32(h.save_game_version);
    out_.write_i32(h.package_file_version_ue4);
    out_.write_i32(h.package_file_version_ue5);
    out_.write_u16(h.engine_version_major);
    out_.write_u16(h.engine_version_minor);
    out_.write_u16(h.engine_version_patch);
    out_.write_u32(h.engine_version_changelist);
    out_.write_fstring(h.engine_version_branch);
    out_.write_i32(h.custom_version_format);
    out_.write_u32(checked_count(h.custom_versions.size(), "custom version list"));
    for (const auto& cv : h.custom_versions) {
        out_.write_guid(cv.id);
        out_.write_i32(cv.version);
    }
    out_.write_fstring(h.save_game_class_name);
}

void PropertyWriter::write_properties(const PropertyList& properties) {
    if (depth_ >= kMaxNestingDepth) {
        invalid("property scopes nested deeper than " + std::to_string(kMaxNestingDepth));
    }
    ScopeDepth scope(depth_);
    for (const auto& np : properties) {
        if (np.name.empty() || np.name == "None") {
            invalid("property name \"" + np.name + "\" would terminate its scope");
        }
        write_property(np);
    }
    out_.write_fstring("None");
}

void PropertyWriter::write_property(const NamedProperty& np) {
    ByteWriter head(64);
    PropertyWriter body(depth_);
    std::visit([&](const auto& v) { encode(v, np.property.id, head, body); }, np.property.value);

    out_.write_fstring(np.name);
    out_.write_fstring(type_name(np.property));
    out_.write_u64(body.size());
    out_.write_bytes(head.bytes());
    out_.write_bytes(body.bytes());
}

void PropertyWriter::encode(const IntProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_i32(v.value);
}

void PropertyWriter::encode(const Int8Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_i8(v.value);
}

void PropertyWriter::encode(const Int16Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_i16(v.value);
}

void PropertyWriter::encode(const UInt16Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_u16(v.value);
}

void PropertyWriter::encode(const UInt32Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_u32(v.value);
}

void PropertyWriter::encode(const Int64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_i64(v.value);
}

void PropertyWriter::encode(const UInt64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_u64(v.value);
}

void PropertyWriter::encode(const FixedPoint64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_i32(v.value);
}

void PropertyWriter::encode(const FloatProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_f32(v.value);
}

void PropertyWriter::encode(const DoubleProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_f64(v.value);
}

void PropertyWriter::encode(const BoolProperty& v, const Id& id, ByteWriter& head, PropertyWriter&) {
    // The value byte sits before the id and the declared size stays 0.
    head.write_u8(v.value ? 1 : 0);
    head.write_optional_guid(id);
}

void PropertyWriter::encode(const StrProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_fstring(v.value);
}

void PropertyWriter::encode(const NameProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_fstring(v.value);
}

void PropertyWriter::encode(const ObjectProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_fstring(v.value);
}

void PropertyWriter::encode(const SoftObjectProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_fstring(v.value.path);
    body.out_.write_fstring(v.value.sub_path);
}

void PropertyWriter::encode(const EnumProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.enum_type);
    head.write_optional_guid(id);
    body.out_.write_fstring(v.value);
}

void PropertyWriter::encode(const ByteProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.enum_type);
    head.write_optional_guid(id);
    if (v.enum_type == "None") {
        const auto* b = std::get_if<std::uint8_t>(&v.value);
        if (!b) {
            invalid("ByteProperty without an enum type must hold a byte");
        }
        body.out_.write_u8(*b);
    } else {
        const auto* s = std::get_if<std::string>(&v.value);
        if (!s) {
            invalid("ByteProperty of enum " + v.enum_type + " must hold a value name");
        }
        body.out_.write_fstring(*s);
    }
}

void PropertyWriter::encode(const TextProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_optional_guid(id);
    body.out_.write_bytes(v.raw);
}

void PropertyWriter::encode(const StructProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.struct_type);
    head.write_guid(v.struct_id);
    head.write_optional_guid(id);
    body.write_struct_value(v.struct_type, v.value);
}

void PropertyWriter::encode(const ArrayProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.element_type);
    head.write_optional_guid(id);

    const bool byte_elements = v.element_type == "ByteProperty";
    ByteWriter& out = body.out_;
    std::visit(
        [&](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::vector<Value>>) {
                out.write_u32(checked_count(value.size(), "array"));
                for (const auto& element : value) {
                    body.write_element(v.element_type, {}, element);
                }
            } else if constexpr (std::is_same_v<T, Bytes>) {
                if (!byte_elements) {
                    invalid("byte blob in an array of " + v.element_type);
                }
                out.write_u32(checked_count(value.size(), "byte array"));
                out.write_bytes(value);
            } else if constexpr (std::is_same_v<T, RawArray>) {
                out.write_u32(value.count);
                out.write_bytes(value.raw);
            } else if constexpr (std::is_same_v<T, StructArray>) {
                if (v.element_type != "StructProperty") {
                    invalid("struct elements in an array of " + v.element_type);
                }
                body.write_struct_array(value);
            } else if constexpr (std::is_same_v<T, GroupRecord>) {
                if (!byte_elements) {
                    invalid("group record in an array of " + v.element_type);
                }
                const Bytes blob = encode_group_record(value);
                out.write_u32(checked_count(blob.size(), "group record"));
                out.write_bytes(blob);
            } else if constexpr (std::is_same_v<T, CharacterRecord>) {
                if (!byte_elements) {
                    invalid("character record in an array of " + v.element_type);
                }
                const Bytes blob = encode_character_record(value, depth_);
                out.write_u32(checked_count(blob.size(), "character record"));
                out.write_bytes(blob);
            }
        },
        v.value
    );
}

void PropertyWriter::encode(const MapProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.key_type);
    head.write_fstring(v.value_type);
    head.write_optional_guid(id);
    body.out_.write_u32(v.reserved);
    body.out_.write_u32(checked_count(v.entries.size(), "map"));
    for (const auto& entry : v.entries) {
        body.write_element(v.key_type, v.key_struct_type, entry.key);
        body.write_element(v.value_type, v.value_struct_type, entry.value);
    }
}

void PropertyWriter::encode(const SetProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    head.write_fstring(v.element_type);
    head.write_optional_guid(id);
    body.out_.write_u32(v.reserved);
    body.out_.write_u32(checked_count(v.elements.size(), "set"));
    for (const auto& element : v.elements) {
        body.write_element(v.element_type, {}, element);
    }
}

void PropertyWriter::encode(const OpaqueProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body) {
    if (v.type_name == "ArrayProperty" || v.type_name == "SetProperty") {
        head.write_fstring(v.inner_type);
    } else if (v.type_name == "MapProperty") {
        head.write_fstring(v.inner_type);
        head.write_fstring(v.value_type);
    } else if (v.type_name == "StructProperty") {
        head.write_fstring(v.inner_type);
        head.write_guid(v.struct_id);
    }
    head.write_optional_guid(id);
    body.out_.write_bytes(v.raw);
}

void PropertyWriter::write_struct_value(std::string_view struct_type, const StructValue& value) {
    if (layout_for(struct_type) != layout_of(value)) {
        invalid("struct " + std::string(struct_type) + " holds a value of a different layout");
    }
    std::visit(
        [&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, PropertyList>) {
                write_properties(v);
            } else if constexpr (std::is_same_v<T, Guid>) {
                out_.write_guid(v);
            } else if constexpr (std::is_same_v<T, DateTime>) {
                out_.write_u64(v.ticks);
            } else if constexpr (std::is_same_v<T, Timespan>) {
                out_.write_i64(v.ticks);
            } else if constexpr (std::is_same_v<T, Vector3d>) {
                out_.write_f64(v.x);
                out_.write_f64(v.y);
                out_.write_f64(v.z);
            } else if constexpr (std::is_same_v<T, Vector4d>) {
                out_.write_f64(v.x);
                out_.write_f64(v.y);
                out_.write_f64(v.z);
                out_.write_f64(v.w);
            } else if constexpr (std::is_same_v<T, Vector2d>) {
                out_.write_f64(v.x);
                out_.write_f64(v.y);
            } else if constexpr (std::is_same_v<T, Vector2f>) {
                out_.write_f32(v.x);
                out_.write_f32(v.y);
            } else if constexpr (std::is_same_v<T, Vector3f>) {
                out_.write_f32(v.x);
                out_.write_f32(v.y);
                out_.write_f32(v.z);
            } else if constexpr (std::is_same_v<T, IntVector>) {
                out_.write_i32(v.x);
                out_.write_i32(v.y);
                out_.write_i32(v.z);
            } else if constexpr (std::is_same_v<T, IntPoint>) {
                out_.write_i32(v.x);
                out_.write_i32(v.y);
            } else if constexpr (std::is_same_v<T, LinearColor>) {
                out_.write_f32(v.r);
                out_.write_f32(v.g);
                out_.write_f32(v.b);
                out_.write_f32(v.a);
            } else if constexpr (std::is_same_v<T, Color>) {
                out_.write_u8(v.b);
                out_.write_u8(v.g);
                out_.write_u8(v.r);
                out_.write_u8(v.a);
            } else if constexpr (std::is_same_v<T, Box>) {
                out_.write_f64(v.min.x);
                out_.write_f64(v.min.y);
                out_.write_f64(v.min.z);
                out_.write_f64(v.max.x);
                out_.write_f64(v.max.y);
                out_.write_f64(v.max.z);
                out_.write_u8(v.valid);
            }
        },
        value
    );
}

void PropertyWriter::write_struct_array(const StructArray& array) {
    PropertyWriter elements(depth_);
    for (const auto& value : array.values) {
        elements.write_struct_value(array.type_name, value);
    }
    out_.write_u32(checked_count(array.values.size(), "struct array"));
    out_.write_fstring(array.prop_name);
    out_.write_fstring(array.prop_type);
    out_.write_u64(elements.size());
    out_.write_fstring(array.type_name);
    out_.write_guid(array.array_id);
    out_.write_optional_guid(array.element_id);
    out_.write_bytes(elements.bytes());
}

void PropertyWriter::write_element(std::string_view type, std::string_view struct_type, const Value& value) {
    if (type == "StructProperty") {
        write_struct_value(struct_type, expect<StructValue>(value, type));
    } else if (type == "EnumProperty" || type == "NameProperty" || type == "StrProperty"
               || type == "ObjectProperty") {
        out_.write_fstring(expect<std::string>(value, type));
    } else if (type == "Guid") {
        out_.write_guid(expect<Guid>(value, type));
    } else if (type == "SoftObjectProperty") {
        const auto& so = expect<SoftObjectPath>(value, type);
        out_.write_fstring(so.path);
        out_.write_fstring(so.sub_path);
    } else if (type == "ByteProperty") {
        out_.write_u8(expect<std::uint8_t>(value, type));
    } else if (type == "BoolProperty") {
        out_.write_u8(expect<bool>(value, type) ? 1 : 0);
    } else if (type == "IntProperty") {
        out_.write_i32(expect<std::int32_t>(value, type));
    } else if (type == "UInt32Property") {
        out_.write_u32(expect<std::uint32_t>(value, type));
    } else if (type == "Int64Property") {
        out_.write_i64(expect<std::int64_t>(value, type));
    } else if (type == "UInt64Property") {
        out_.write_u64(expect<std::uint64_t>(value, type));
    } else if (type == "FloatProperty") {
        out_.write_f32(expect<float>(value, type));
    } else if (type == "DoubleProperty") {
        out_.write_f64(expect<double>(value, type));
    } else {
        // Map and set elements of other types are property scopes.
        const auto& sv = expect<StructValue>(value, type);
        const auto* bag = std::get_if<PropertyList>(&sv);
        if (!bag) {
            invalid("element of type " + std::string(type) + " must be a property scope");
        }
        write_properties(*bag);
    }
}

Bytes write_save(const SaveFile& save) {
    PropertyWriter writer;
    writer.write_header(save.header);
    writer.write_properties(save.properties);
    writer.write_raw(save.trailer);
    return writer.take();
}
}  // namespace palsav::gvas

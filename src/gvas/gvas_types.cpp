/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_types.h"

#include <array>
#include <type_traits>
#include <utility>

namespace palsav::gvas {
namespace {
constexpr std::array<std::pair<std::string_view, StructLayout>, 17> kStructLayouts = {{
    {"Vector", StructLayout::Vector3d},
    {"Rotator", StructLayout::Vector3d},
    {"Quat", StructLayout::Vector4d},
    {"Vector4", StructLayout::Vector4d},
    {"Plane", StructLayout::Vector4d},
    {"Vector2D", StructLayout::Vector2d},
    {"Vector2f", StructLayout::Vector2f},
    {"Vector2D_f", StructLayout::Vector2f},
    {"Vector3f", StructLayout::Vector3f},
    {"IntVector", StructLayout::IntVector},
    {"IntPoint", StructLayout::IntPoint},
    {"LinearColor", StructLayout::LinearColor},
    {"Color", StructLayout::Color},
    {"DateTime", StructLayout::DateTime},
    {"Timespan", StructLayout::Timespan},
    {"Guid", StructLayout::Guid},
    {"Box", StructLayout::Box},
}};

constexpr std::array<std::string_view, 23> kTypeNames = {
    "IntProperty",
    "Int8Property",
    "Int16Property",
    "UInt16Property",
    "UInt32Property",
    "Int64Property",
    "UInt64Property",
    "FixedPoint64Property",
    "FloatProperty",
    "DoubleProperty",
    "BoolProperty",
    "StrProperty",
    "NameProperty",
    "ObjectProperty",
    "SoftObjectProperty",
    "EnumProperty",
    "ByteProperty",
    "TextProperty",
    "StructProperty",
    "ArrayProperty",
    "MapProperty",
    "SetProperty",
    "",
};
static_assert(kTypeNames.size() == std::variant_size_v<PropertyValue>);

template <typename List, typename Prop>
Prop* find_in(List& list, std::string_view name) {
    for (auto& np : list) {
        if (np.name == name) {
            return &np.property;
        }
    }
    return nullptr;
}

template <typename List, typename Prop>
Prop* find_path_in(List& list, std::string_view dotted) {
    List* scope = &list;
    while (true) {
        const auto dot = dotted.find('.');
        const std::string_view head = dotted.substr(0, dot);
        Prop* p = find_in<List, Prop>(*scope, head);
        if (!p || dot == std::string_view::npos) {
            return p;
        }
        scope = struct_fields(*p);
        if (!scope) {
            return nullptr;
        }
        dotted.remove_prefix(dot + 1);
    }
}
}  // namespace

StructLayout layout_for(std::string_view struct_type) {
    for (const auto& [name, layout] : kStructLayouts) {
        if (name == struct_type) {
            return layout;
        }
    }
    return StructLayout::Generic;
}

StructLayout layout_of(const StructValue& value) {
    // Alternatives are declared in the same order as the enum.
    return static_cast<StructLayout>(value.index());
}

StructValue default_struct_value(StructLayout layout) {
    switch (layout) {
        case StructLayout::Generic:
            return PropertyList{};
        case StructLayout::Guid:
            return Guid{};
        case StructLayout::DateTime:
            return DateTime{};
        case StructLayout::Timespan:
            return Timespan{};
        case StructLayout::Vector3d:
            return Vector3d{};
        case StructLayout::Vector4d:
            return Vector4d{};
        case StructLayout::Vector2d:
            return Vector2d{};
        case StructLayout::Vector2f:
            return Vector2f{};
        case StructLayout::Vector3f:
            return Vector3f{};
        case StructLayout::IntVector:
            return IntVector{};
        case StructLayout::IntPoint:
            return IntPoint{};
        case StructLayout::LinearColor:
            return LinearColor{};
        case StructLayout::Color:
            return Color{};
        case StructLayout::Box:
            return Box{};
    }
    return PropertyList{};
}

GroupKind group_kind_from_enum(std::string_view group_type) {
    if (group_type == "EPalGroupType::Guild") {
        return GroupKind::Guild;
    }
    if (group_type == "EPalGroupType::IndependentGuild") {
        return GroupKind::IndependentGuild;
    }
    if (group_type == "EPalGroupType::Organization") {
        return GroupKind::Organization;
    }
    return GroupKind::Unknown;
}

std::string_view group_kind_enum_name(GroupKind kind) {
    switch (kind) {
        case GroupKind::Guild:
            return "EPalGroupType::Guild";
        case GroupKind::IndependentGuild:
            return "EPalGroupType::IndependentGuild";
        case GroupKind::Organization:
            return "EPalGroupType::Organization";
        case GroupKind::Unknown:
            break;
    }
    return {};
}

GroupKind GroupRecord::kind() const {
    switch (details.index()) {
        case 1:
            return GroupKind::Guild;
        case 2:
            return GroupKind::IndependentGuild;
        case 3:
            return GroupKind::Organization;
        default:
            return GroupKind::Unknown;
    }
}

std::string type_name(const Property& property) {
    if (const auto* opaque = std::get_if<OpaqueProperty>(&property.value)) {
        return opaque->type_name;
    }
    return std::string(kTypeNames[property.value.index()]);
}

const Property* find_property(const PropertyList& list, std::string_view name) {
    return find_in<const PropertyList, const Property>(list, name);
}

Property* find_property(PropertyList& list, std::string_view name) {
    return find_in<PropertyList, Property>(list, name);
}

const Property* find_path(const PropertyList& list, std::string_view dotted) {
    return find_path_in<const PropertyList, const Property>(list, dotted);
}

Property* find_path(PropertyList& list, std::string_view dotted) {
    return find_path_in<PropertyList, Property>(list, dotted);
}

const PropertyList* struct_fields(const Property& property) {
    const auto* sp = std::get_if<StructProperty>(&property.value);
    return sp ? std::get_if<PropertyList>(&sp->value) : nullptr;
}

PropertyList* struct_fields(Property& property) {
    auto* sp = std::get_if<StructProperty>(&property.value);
    return sp ? std::get_if<PropertyList>(&sp->value) : nullptr;
}

std::optional<Guid> guid_value(const Property& property) {
    const auto* sp = std::get_if<StructProperty>(&property.value);
    if (!sp) {
        return std::nullopt;
    }
    if (const auto* g = std::get_if<Guid>(&sp->value)) {
        return *g;
    }
    return std::nullopt;
}

const std::string* string_value(const Property& property) {
    return std::visit(
        [](const auto& v) -> const std::string* {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, StrProperty> || std::is_same_v<T, NameProperty>
                          || std::is_same_v<T, ObjectProperty> || std::is_same_v<T, EnumProperty>) {
                return &v.value;
            } else {
                return nullptr;
            }
        },
        property.value
    );
}
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_visitor.h"

#include <type_traits>

namespace palsav::gvas {
namespace {
void walk_struct(StructValue& value, TreeVisitor& visitor) {
    if (auto* fields = std::get_if<PropertyList>(&value)) {
        walk_tree(*fields, visitor);
    }
}

void walk_value(Value& value, TreeVisitor& visitor) {
    visitor.visit_value(value);
    if (auto* sv = std::get_if<StructValue>(&value)) {
        walk_struct(*sv, visitor);
    }
}

void walk_children(Property& property, TreeVisitor& visitor) {
    std::visit(
        [&](auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, StructProperty>) {
                walk_struct(v.value, visitor);
            } else if constexpr (std::is_same_v<T, ArrayProperty>) {
                if (auto* values = std::get_if<std::vector<Value>>(&v.value)) {
                    for (auto& value : *values) {
                        walk_value(value, visitor);
                    }
                } else if (auto* sa = std::get_if<StructArray>(&v.value)) {
                    for (auto& value : sa->values) {
                        walk_struct(value, visitor);
                    }
                } else if (auto* group = std::get_if<GroupRecord>(&v.value)) {
                    visitor.visit_group_record(*group);
                } else if (auto* character = std::get_if<CharacterRecord>(&v.value)) {
                    visitor.visit_character_record(*character);
                    walk_tree(character->object, visitor);
                }
            } else if constexpr (std::is_same_v<T, MapProperty>) {
                for (auto& entry : v.entries) {
                    walk_value(entry.key, visitor);
                    walk_value(entry.value, visitor);
                }
            } else if constexpr (std::is_same_v<T, SetProperty>) {
                for (auto& element : v.elements) {
                    walk_value(element, visitor);
                }
            }
        },
        property.value
    );
}
}  // namespace

void walk_tree(PropertyList& properties, TreeVisitor& visitor) {
    for (auto& np : properties) {
        if (visitor.enter_property(np.name, np.property)) {
            walk_children(np.property, visitor);
        }
    }
}

void walk_tree(SaveFile& save, TreeVisitor& visitor) {
    walk_tree(save.properties, visitor);
}
}  // namespace palsav::gvas

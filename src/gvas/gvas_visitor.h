/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_types.h"

#include <string>

namespace palsav::gvas {
/**
 * Callbacks for walk_tree. The walk is depth-first in wire order and reaches
 * every property scope: struct fields, array/map/set elements, struct array
 * elements and the property scope embedded in character records.
 */
class TreeVisitor {
   public:
    virtual ~TreeVisitor() = default;

    // Return false to skip the children of this property.
    virtual bool enter_property(const std::string& name, Property& property) {
        (void)name;
        (void)property;
        return true;
    }
    virtual void visit_value(Value& value) { (void)value; }
    virtual void visit_group_record(GroupRecord& record) { (void)record; }
    // Called before the record's property scope is walked.
    virtual void visit_character_record(CharacterRecord& record) { (void)record; }
};

void walk_tree(PropertyList& properties, TreeVisitor& visitor);
void walk_tree(SaveFile& save, TreeVisitor& visitor);
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_visitor.h"

#include <array>
#include <cstddef>
#include <string_view>

namespace palsav::gvas {
// Property names whose value is exchanged when it holds one of the two identities.
constexpr std::array<std::string_view, 4> kWatchedIdentityFields = {
    "OwnerPlayerUId",
    "owner_player_uid",
    "build_player_uid",
    "private_lock_player_uid",
};

/**
 * Exchanges two player identities wherever a watched field holds one of
 * them. Watched fields are the property names above (Guid structs or
 * string properties holding a GUID) plus the identity fields of decoded
 * group records. Other fields are left alone even when they hold a match.
 */
class IdentitySwap : public TreeVisitor {
   public:
    IdentitySwap(const Guid& a, const Guid& b) : a_(a), b_(b) {}

    bool enter_property(const std::string& name, Property& property) override;
    void visit_group_record(GroupRecord& record) override;

    std::size_t swaps() const { return swaps_; }

   private:
    bool swap(Guid& guid);
    bool swap(std::string& text);

    Guid a_;
    Guid b_;
    std::size_t swaps_ = 0;
};

// Returns the number of fields changed. Swapping the same pair twice restores the tree.
std::size_t swap_identity(PropertyList& properties, const Guid& a, const Guid& b);
std::size_t swap_identity(SaveFile& save, const Guid& a, const Guid& b);
}  // namespace palsav::gvas

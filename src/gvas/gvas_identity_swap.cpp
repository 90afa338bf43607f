/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_identity_swap.h"

#include <algorithm>
#include <cctype>

namespace palsav::gvas {
namespace {
bool is_watched(std::string_view name) {
    return std::find(kWatchedIdentityFields.begin(), kWatchedIdentityFields.end(), name)
        != kWatchedIdentityFields.end();
}

// Renders `guid` with the dashes and letter case used by `original`.
std::string format_like(std::string_view original, const Guid& guid) {
    std::string out = guid.to_string();
    if (original.find('-') == std::string_view::npos) {
        out.erase(std::remove(out.begin(), out.end(), '-'), out.end());
    }
    const bool upper = std::any_of(original.begin(), original.end(), [](char c) {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    });
    if (upper) {
        std::transform(out.begin(), out.end(), out.begin(), [](char c) {
            return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        });
    }
    return out;
}
}  // namespace

bool IdentitySwap::swap(Guid& guid) {
    if (a_ == b_) {
        return false;
    }
    if (guid == a_) {
        guid = b_;
    } else if (guid == b_) {
        guid = a_;
    } else {
        return false;
    }
    swaps_++;
    return true;
}

bool IdentitySwap::swap(std::string& text) {
    const auto parsed = Guid::try_parse(text);
    if (!parsed) {
        return false;
    }
    Guid g = *parsed;
    if (!swap(g)) {
        return false;
    }
    text = format_like(text, g);
    return true;
}

bool IdentitySwap::enter_property(const std::string& name, Property& property) {
    if (!is_watched(name)) {
        return true;
    }
    if (auto* sp = std::get_if<StructProperty>(&property.value)) {
        if (auto* g = std::get_if<Guid>(&sp->value)) {
            swap(*g);
            return false;
        }
    } else if (auto* str = std::get_if<StrProperty>(&property.value)) {
        swap(str->value);
    } else if (auto* nm = std::get_if<NameProperty>(&property.value)) {
        swap(nm->value);
    }
    return true;
}

void IdentitySwap::visit_group_record(GroupRecord& record) {
    for (auto& handle : record.handles) {
        swap(handle.guid);
    }
    if (auto* guild = std::get_if<GuildData>(&record.details)) {
        swap(guild->admin_player_uid);
        for (auto& member : guild->players) {
            swap(member.player_uid);
        }
    } else if (auto* independent = std::get_if<IndependentGuildData>(&record.details)) {
        swap(independent->player_uid);
    }
}

std::size_t swap_identity(PropertyList& properties, const Guid& a, const Guid& b) {
    IdentitySwap swapper(a, b);
    walk_tree(properties, swapper);
    return swapper.swaps();
}

std::size_t swap_identity(SaveFile& save, const Guid& a, const Guid& b) {
    return swap_identity(save.properties, a, b);
}
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_types.h"

#include <cstdint>
#include <span>

namespace palsav::gvas {
// Organization records carry at least this many bytes after the org type.
constexpr std::size_t kOrganizationTrailerSize = 12;

/**
 * Decodes the RawData blob of a GroupSaveDataMap entry. `kind` comes from the
 * sibling GroupType enum and selects the layout after the common prefix.
 * Throws SaveError(SubRecord) when the blob is shorter than its layout.
 */
GroupRecord decode_group_record(std::span<const std::uint8_t> blob, GroupKind kind);

Bytes encode_group_record(const GroupRecord& record);
}  // namespace palsav::gvas

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_policy.h"
#include "gvas/gvas_types.h"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace palsav::gvas {
// reserved[4] + group id; anything after them is kept as trailing bytes.
constexpr std::size_t kCharacterGroupBlockSize = 20;
// Minimum bytes after the property scope for the group block to be decoded.
constexpr std::size_t kCharacterGroupBlockThreshold = 24;

/**
 * Decodes the RawData blob of a CharacterSaveParameterMap value: a property
 * scope (read with root-relative paths) followed by the group block.
 * `depth` is the scope depth of the enclosing tree.
 */
CharacterRecord decode_character_record(std::span<const std::uint8_t> blob,
                                        const PolicyTable& policy,
                                        std::vector<std::string>* warnings,
                                        int depth);

Bytes encode_character_record(const CharacterRecord& record, int depth);
}  // namespace palsav::gvas

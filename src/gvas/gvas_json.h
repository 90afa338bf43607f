/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_types.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>

namespace palsav::gvas {
/**
 * JSON rendition of a decoded save. Properties are arrays of objects
 * ({"name", "type", ...}) so order and duplicate names survive; raw byte
 * payloads are base64 strings and GUIDs use the dashed lowercase form.
 * save_from_json(to_json(x)) == x for every tree the reader produces.
 */
nlohmann::ordered_json to_json(const SaveFile& save, std::optional<std::uint8_t> save_type = std::nullopt);

// Throws SaveError(InvalidTree) on a document that does not describe a save.
SaveFile save_from_json(const nlohmann::ordered_json& doc);

// The envelope variant recorded by to_json, if any.
std::optional<std::uint8_t> save_type_of(const nlohmann::ordered_json& doc);
}  // namespace palsav::gvas

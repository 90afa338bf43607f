/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_byte_reader.h"
#include "gvas/gvas_policy.h"
#include "gvas/gvas_types.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace palsav::gvas {
// Property scopes nested deeper than this are rejected.
constexpr int kMaxNestingDepth = 128;

/**
 * Decodes a GVAS payload (header, root property scope, trailer) into the
 * typed tree. Recoverable problems in domain sub-records are appended to
 * `warnings`; the affected blob is then kept undecoded.
 */
class PropertyReader {
   public:
    PropertyReader(std::span<const std::uint8_t> data,
                   const PolicyTable& policy,
                   std::vector<std::string>* warnings = nullptr,
                   int depth = 0);

    GvasHeader read_header();
    PropertyList read_properties(const std::string& path);
    Bytes read_trailer() { return reader_.read_rest(); }

    std::size_t position() const { return reader_.position(); }
    std::size_t remaining() const { return reader_.remaining(); }

   private:
    Property read_property(const std::string& type, std::uint64_t size, const std::string& path);
    Property read_opaque(const std::string& type, std::uint64_t size, OpaqueReason reason);
    Property read_array(std::uint64_t size, const std::string& path);
    Property read_map(const std::string& path);
    Property read_set(const std::string& path);

    StructValue read_struct_value(std::string_view struct_type, const std::string& path);
    StructArray read_struct_array(std::uint32_t count, const std::string& path);
    std::optional<Value> read_scalar(std::string_view type);
    Value read_element(std::string_view type, const std::string& struct_hint, const std::string& path);

    ArrayValue decode_character_blob(Bytes blob, const std::string& path);
    void decode_group_map(MapProperty& map, const std::string& path);

    void warn(std::string message);

    ByteReader reader_;
    const PolicyTable& policy_;
    std::vector<std::string>* warnings_;
    int depth_;
};

SaveFile read_save(std::span<const std::uint8_t> gvas,
                   const PolicyTable& policy = PolicyTable::defaults(),
                   std::vector<std::string>* warnings = nullptr);
}  // namespace palsav::gvas

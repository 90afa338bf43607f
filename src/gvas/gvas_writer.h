/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "gvas/gvas_byte_writer.h"
#include "gvas/gvas_types.h"

#include <optional>
#include <string_view>

namespace palsav::gvas {
/**
 * Inverse of PropertyReader. Each property payload is produced in a scratch
 * writer first so its size field can be emitted ahead of it; the metadata
 * between the size and the payload is not counted.
 *
 * Throws SaveError(InvalidTree) when a node cannot be expressed on the wire,
 * e.g. a struct value whose layout disagrees with its struct type name.
 */
class PropertyWriter {
   public:
    explicit PropertyWriter(int depth = 0) : depth_(depth) {}

    void write_header(const GvasHeader& header);
    // Writes the properties followed by the "None" terminator.
    void write_properties(const PropertyList& properties);
    void write_raw(std::span<const std::uint8_t> bytes) { out_.write_bytes(bytes); }

    std::size_t size() const { return out_.size(); }
    const Bytes& bytes() const { return out_.bytes(); }
    Bytes take() { return out_.take(); }

   private:
    using Id = std::optional<Guid>;

    void write_property(const NamedProperty& property);

    void encode(const IntProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const Int8Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const Int16Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const UInt16Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const UInt32Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const Int64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const UInt64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const FixedPoint64Property& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const FloatProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const DoubleProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const BoolProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const StrProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const NameProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const ObjectProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const SoftObjectProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const EnumProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const ByteProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const TextProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const StructProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const ArrayProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const MapProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const SetProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);
    void encode(const OpaqueProperty& v, const Id& id, ByteWriter& head, PropertyWriter& body);

    void write_struct_value(std::string_view struct_type, const StructValue& value);
    void write_struct_array(const StructArray& array);
    void write_element(std::string_view type, std::string_view struct_type, const Value& value);

    ByteWriter out_;
    int depth_;
};

Bytes write_save(const SaveFile& save);
}  // namespace palsav::gvas

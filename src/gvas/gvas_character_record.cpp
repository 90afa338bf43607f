/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "gvas/gvas_character_record.h"

#include "gvas/gvas_byte_reader.h"
#include "gvas/gvas_error.h"
#include "gvas/gvas_reader.h"
#include "gvas/gvas_writer.h"

namespace palsav::gvas {
CharacterRecord decode_character_record(std::span<const std::uint8_t> blob,
                                        const PolicyTable& policy,
                                        std::vector<std::string>* warnings,
                                        int depth) {
    CharacterRecord rec;
    std::size_t end = 0;
    try {
        PropertyReader reader(blob, policy, warnings, depth);
        rec.object = reader.read_properties("");
        end = reader.position();
    } catch (const SaveError& e) {
        throw SaveError(ErrorKind::SubRecord, std::string("character record: ") + e.what(), e.path());
    }

    ByteReader tail(blob.subspan(end));
    if (tail.remaining() >= kCharacterGroupBlockThreshold) {
        rec.has_group_block = true;
        rec.reserved = tail.read_array<4>();
        rec.group_id = tail.read_guid();
    }
    rec.trailing_bytes = tail.read_rest();
    return rec;
}

Bytes encode_character_record(const CharacterRecord& record, int depth) {
    PropertyWriter writer(depth);
    writer.write_properties(record.object);
    if (record.has_group_block) {
        ByteWriter block(kCharacterGroupBlockSize);
        block.write_bytes(record.reserved);
        block.write_guid(record.group_id);
        writer.write_raw(block.bytes());
    }
    writer.write_raw(record.trailing_bytes);
    return writer.take();
}
}  // namespace palsav::gvas

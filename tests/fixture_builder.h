/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// Assembles GVAS bytes by hand. Nothing here calls into the codec, so the
// size fields and layouts it produces are an independent reference.
namespace palsav::fixture {
using Blob = std::vector<std::uint8_t>;

class Buf {
   public:
    Buf& u8(std::uint8_t v) {
        data.push_back(v);
        return *this;
    }
    Buf& u16(std::uint16_t v) { return le(v, 2); }
    Buf& u32(std::uint32_t v) { return le(v, 4); }
    Buf& u64(std::uint64_t v) { return le(v, 8); }
    Buf& i32(std::int32_t v) { return le(static_cast<std::uint32_t>(v), 4); }
    Buf& i64(std::int64_t v) { return le(static_cast<std::uint64_t>(v), 8); }

    Buf& f32(float v) {
        std::uint32_t bits = 0;
        std::memcpy(&bits, &v, 4);
        return u32(bits);
    }

    Buf& f64(double v) {
        std::uint64_t bits = 0;
        std::memcpy(&bits, &v, 8);
        return u64(bits);
    }

    // ASCII FString: length includes the NUL.
    Buf& str(std::string_view s) {
        if (s.empty()) {
            return i32(0);
        }
        i32(static_cast<std::int32_t>(s.size() + 1));
        data.insert(data.end(), s.begin(), s.end());
        return u8(0);
    }

    // UTF-16 FString from BMP code units.
    Buf& wstr(const std::u16string& s) {
        i32(-static_cast<std::int32_t>(s.size() + 1));
        for (char16_t c : s) {
            u16(static_cast<std::uint16_t>(c));
        }
        return u16(0);
    }

    // "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" written the way the engine stores it:
    // four little-endian 32-bit words.
    Buf& guid(std::string_view text) {
        std::uint8_t b[16] = {};
        int n = 0;
        for (char c : text) {
            if (c == '-') {
                continue;
            }
            int v = 0;
            if (c >= '0' && c <= '9') {
                v = c - '0';
            } else if (c >= 'a' && c <= 'f') {
                v = c - 'a' + 10;
            } else if (c >= 'A' && c <= 'F') {
                v = c - 'A' + 10;
            } else {
                throw std::invalid_argument("bad guid text");
            }
            b[n / 2] = static_cast<std::uint8_t>(n % 2 == 0 ? v << 4 : b[n / 2] | v);
            n++;
        }
        if (n != 32) {
            throw std::invalid_argument("bad guid text");
        }
        for (int word = 0; word < 4; word++) {
            for (int i = 3; i >= 0; i--) {
                u8(b[word * 4 + i]);
            }
        }
        return *this;
    }

    Buf& zero_guid() {
        for (int i = 0; i < 16; i++) {
            u8(0);
        }
        return *this;
    }

    Buf& raw(const Blob& bytes) {
        data.insert(data.end(), bytes.begin(), bytes.end());
        return *this;
    }

    Buf& raw(const Buf& other) { return raw(other.data); }

    std::size_t size() const { return data.size(); }

    Blob data;

   private:
    Buf& le(std::uint64_t v, int width) {
        for (int i = 0; i < width; i++) {
            data.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
        }
        return *this;
    }
};

inline Buf none() {
    return Buf().str("None");
}

// name, type, u64 size of `body`, then the type-specific head and the body.
inline Buf prop(std::string_view name, std::string_view type, const Buf& head, const Buf& body) {
    Buf b;
    b.str(name).str(type).u64(body.size()).raw(head).raw(body);
    return b;
}

inline Buf no_id() {
    return Buf().u8(0);
}

inline Buf int_prop(std::string_view name, std::int32_t v) {
    return prop(name, "IntProperty", no_id(), Buf().i32(v));
}

inline Buf int64_prop(std::string_view name, std::int64_t v) {
    return prop(name, "Int64Property", no_id(), Buf().i64(v));
}

inline Buf float_prop(std::string_view name, float v) {
    return prop(name, "FloatProperty", no_id(), Buf().f32(v));
}

inline Buf bool_prop(std::string_view name, bool v) {
    return prop(name, "BoolProperty", Buf().u8(v ? 1 : 0).u8(0), Buf());
}

inline Buf str_prop(std::string_view name, std::string_view v) {
    return prop(name, "StrProperty", no_id(), Buf().str(v));
}

inline Buf name_prop(std::string_view name, std::string_view v) {
    return prop(name, "NameProperty", no_id(), Buf().str(v));
}

inline Buf enum_prop(std::string_view name, std::string_view enum_type, std::string_view v) {
    return prop(name, "EnumProperty", Buf().str(enum_type).u8(0), Buf().str(v));
}

inline Buf byte_prop(std::string_view name, std::uint8_t v) {
    return prop(name, "ByteProperty", Buf().str("None").u8(0), Buf().u8(v));
}

inline Buf struct_prop(std::string_view name, std::string_view struct_type, const Buf& body) {
    return prop(name, "StructProperty", Buf().str(struct_type).zero_guid().u8(0), body);
}

// A struct whose body is a property scope; `fields` excludes the terminator.
inline Buf scope_prop(std::string_view name, std::string_view struct_type, const Buf& fields) {
    return struct_prop(name, struct_type, Buf().raw(fields).raw(none()));
}

inline Buf guid_prop(std::string_view name, std::string_view guid) {
    return struct_prop(name, "Guid", Buf().guid(guid));
}

inline Buf byte_array_prop(std::string_view name, const Blob& blob) {
    return prop(name, "ArrayProperty", Buf().str("ByteProperty").u8(0),
                Buf().u32(static_cast<std::uint32_t>(blob.size())).raw(blob));
}

inline Buf map_prop(std::string_view name, std::string_view key_type, std::string_view value_type,
                    std::uint32_t count, const Buf& entries, std::uint32_t reserved = 0) {
    return prop(name, "MapProperty", Buf().str(key_type).str(value_type).u8(0),
                Buf().u32(reserved).u32(count).raw(entries));
}

struct MemberRow {
    std::string uid;
    std::int64_t last_online = 0;
    std::string name;
};

struct HandleRow {
    std::string guid;
    std::string instance_id;
};

// guid, name, character handles: the prefix every group record starts with.
inline Buf group_prefix(std::string_view group_id, std::string_view group_name, const std::vector<HandleRow>& handles) {
    Buf b;
    b.guid(group_id).str(group_name).u32(static_cast<std::uint32_t>(handles.size()));
    for (const auto& h : handles) {
        b.guid(h.guid).guid(h.instance_id);
    }
    return b;
}

inline Blob guild_blob(std::string_view group_id, const std::vector<HandleRow>& handles, std::string_view admin,
                       const std::vector<MemberRow>& members, std::string_view guild_name,
                       const Blob& trailing = {}) {
    Buf b = group_prefix(group_id, "Guild Group", handles);
    b.u8(1);
    b.u8(0xA1).u8(0xA2).u8(0xA3).u8(0xA4);
    b.u32(1).guid("bbbbbbbb-0000-0000-0000-000000000001");
    b.i32(0).i32(5);
    b.u32(0);
    b.str(guild_name);
    b.guid("cccccccc-0000-0000-0000-000000000001");
    b.u8(0).u8(0).u8(0).u8(0);
    b.guid(admin);
    b.u32(static_cast<std::uint32_t>(members.size()));
    for (const auto& m : members) {
        b.guid(m.uid).i64(m.last_online).str(m.name);
    }
    b.raw(trailing);
    return b.data;
}

inline Blob independent_guild_blob(std::string_view group_id, const std::vector<HandleRow>& handles,
                                   std::string_view player_uid, std::string_view player_name) {
    Buf b = group_prefix(group_id, "Solo Group", handles);
    b.u8(2);
    b.i32(1).u32(0);
    b.str("Solo Camp");
    b.guid(player_uid);
    b.str("Solo Camp");
    b.i64(0).str(player_name);
    return b.data;
}

// GroupSaveDataMap entry: Guid key, then a scope with GroupType and RawData.
inline Buf group_entry(std::string_view group_id, std::string_view group_type, const Blob& blob) {
    Buf fields;
    fields.raw(enum_prop("GroupType", "EPalGroupType", group_type));
    fields.raw(byte_array_prop("RawData", blob));
    Buf b;
    b.guid(group_id).raw(fields).raw(none());
    return b;
}

// CharacterSaveParameterMap RawData blob: SaveParameter scope, reserved, group id, 4 trailing bytes.
inline Blob character_blob(const Buf& parameters, std::string_view group_id) {
    Buf b;
    b.raw(scope_prop("SaveParameter", "PalIndividualCharacterSaveParameter", parameters)).raw(none());
    b.u8(0).u8(0).u8(0).u8(0).guid(group_id);
    b.u8(0).u8(0).u8(0).u8(0);
    return b.data;
}

inline Buf character_entry(std::string_view player_uid, std::string_view instance_id, const Blob& blob) {
    Buf b;
    b.raw(guid_prop("PlayerUId", player_uid)).raw(guid_prop("InstanceId", instance_id)).raw(none());
    b.raw(byte_array_prop("RawData", blob)).raw(none());
    return b;
}

inline Buf gvas_header(std::string_view class_name = "/Script/Pal.PalWorldSaveGame") {
    Buf b;
    b.raw(Blob{'G', 'V', 'A', 'S'});
    b.i32(3).i32(522).i32(1008);
    b.u16(5).u16(1).u16(1).u32(0);
    b.str("++UE5+Release-5.1");
    b.i32(3);
    b.u32(1).guid("00112233-4455-6677-8899-aabbccddeeff").i32(7);
    b.str(class_name);
    return b;
}

// Header, properties, terminator, optional trailer.
inline Blob gvas_file(const Buf& properties, const Blob& trailer = {}) {
    Buf b = gvas_header();
    b.raw(properties).raw(none()).raw(trailer);
    return b.data;
}
}  // namespace palsav::fixture

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <catch2/catch.hpp>

#include "fixture_builder.h"
#include "gvas/gvas_error.h"
#include "gvas/gvas_reader.h"
#include "gvas/gvas_writer.h"

#include <string>
#include <vector>

using namespace palsav::gvas;
using namespace palsav::fixture;

namespace {
SaveFile decode(const Blob& data, std::vector<std::string>* warnings = nullptr) {
    return read_save(data, PolicyTable::defaults(), warnings);
}

template <typename T>
const T& value_of(const SaveFile& save, std::string_view name) {
    const Property* p = find_property(save.properties, name);
    REQUIRE(p != nullptr);
    const T* v = std::get_if<T>(&p->value);
    REQUIRE(v != nullptr);
    return *v;
}

Buf nested_scopes(int count) {
    Buf inner;
    inner.raw(int_prop("Leaf", 1));
    for (int i = 0; i < count; i++) {
        inner = scope_prop("S", "Nested", inner);
    }
    return inner;
}

PropertyList nested_tree(int count) {
    PropertyList inner{NamedProperty{"Leaf", Property{std::nullopt, IntProperty{1}}}};
    for (int i = 0; i < count; i++) {
        StructProperty sp;
        sp.struct_type = "Nested";
        sp.value = std::move(inner);
        inner = PropertyList{NamedProperty{"S", Property{std::nullopt, std::move(sp)}}};
    }
    return inner;
}
}  // namespace

TEST_CASE("Header fields are decoded and written back", "[tree]") {
    const Blob data = gvas_file(Buf(), Blob{0xAA, 0xBB, 0xCC, 0xDD});
    const SaveFile save = decode(data);
    CHECK(save.header.magic == kGvasMagic);
    CHECK(save.header.save_game_version == 3);
    CHECK(save.header.package_file_version_ue4 == 522);
    CHECK(save.header.package_file_version_ue5 == 1008);
    CHECK(save.header.engine_version_major == 5);
    CHECK(save.header.engine_version_branch == "++UE5+Release-5.1");
    REQUIRE(save.header.custom_versions.size() == 1);
    CHECK(save.header.custom_versions[0].version == 7);
    CHECK(save.header.save_game_class_name == "/Script/Pal.PalWorldSaveGame");
    CHECK(save.properties.empty());
    CHECK(save.trailer == Bytes{0xAA, 0xBB, 0xCC, 0xDD});
    CHECK(write_save(save) == data);
}

TEST_CASE("Bad GVAS magic is an envelope error", "[tree]") {
    Blob data = gvas_file(Buf());
    data[0] = 'X';
    try {
        decode(data);
        FAIL("expected SaveError");
    } catch (const SaveError& e) {
        CHECK(e.kind() == ErrorKind::MalformedEnvelope);
    }
}

TEST_CASE("Scalar properties decode and re-encode byte for byte", "[tree]") {
    Buf props;
    props.raw(int_prop("Count", -7));
    props.raw(bool_prop("Enabled", true));
    props.raw(str_prop("Title", "Palpagos"));
    props.raw(float_prop("Scale", 0.5f));
    props.raw(enum_prop("Mode", "EPalMode", "EPalMode::Hard"));
    props.raw(byte_prop("Level", 42));
    props.raw(int64_prop("Ticks", 638000000000000000LL));
    props.raw(name_prop("Id", "Anubis"));
    const Blob data = gvas_file(props);

    const SaveFile save = decode(data);
    REQUIRE(save.properties.size() == 8);
    CHECK(value_of<IntProperty>(save, "Count").value == -7);
    CHECK(value_of<BoolProperty>(save, "Enabled").value);
    CHECK(value_of<StrProperty>(save, "Title").value == "Palpagos");
    CHECK(value_of<FloatProperty>(save, "Scale").value == 0.5f);
    CHECK(value_of<EnumProperty>(save, "Mode").enum_type == "EPalMode");
    CHECK(value_of<EnumProperty>(save, "Mode").value == "EPalMode::Hard");
    CHECK(std::get<std::uint8_t>(value_of<ByteProperty>(save, "Level").value) == 42);
    CHECK(value_of<Int64Property>(save, "Ticks").value == 638000000000000000LL);
    CHECK(value_of<NameProperty>(save, "Id").value == "Anubis");
    CHECK(save.properties[0].name == "Count");
    CHECK(save.properties[7].name == "Id");

    CHECK(write_save(save) == data);
}

TEST_CASE("Bool value precedes the id and the declared size is zero", "[tree]") {
    SaveFile save;
    save.properties.push_back(NamedProperty{"Flag", Property{std::nullopt, BoolProperty{true}}});
    const Bytes out = write_save(save);
    CHECK(out == gvas_file(bool_prop("Flag", true)));
    CHECK(decode(out) == save);
}

TEST_CASE("Property ids survive a round trip", "[tree]") {
    Buf props;
    props.raw(prop("Count", "IntProperty", Buf().u8(1).guid("11111111-2222-3333-4444-555555555555"), Buf().i32(9)));
    const Blob data = gvas_file(props);
    const SaveFile save = decode(data);
    const Property* p = find_property(save.properties, "Count");
    REQUIRE(p != nullptr);
    REQUIRE(p->id.has_value());
    CHECK(p->id->to_string() == "11111111-2222-3333-4444-555555555555");
    CHECK(write_save(save) == data);
}

TEST_CASE("Non-ASCII strings are written as UTF-16", "[tree]") {
    Buf props;
    props.raw(prop("Nick", "StrProperty", no_id(), Buf().wstr(u"ツナ")));
    const Blob data = gvas_file(props);
    const SaveFile save = decode(data);
    CHECK(value_of<StrProperty>(save, "Nick").value == "\xE3\x83\x84\xE3\x83\x8A");
    CHECK(write_save(save) == data);
}

TEST_CASE("Fixed-layout structs decode to typed values", "[tree]") {
    Buf props;
    props.raw(struct_prop("Location", "Vector", Buf().f64(1.0).f64(-2.0).f64(3.5)));
    props.raw(guid_prop("Owner", "0a0b0c0d-0000-0000-0000-000000000001"));
    props.raw(struct_prop("Tint", "Color", Buf().u8(10).u8(20).u8(30).u8(255)));
    props.raw(struct_prop("When", "DateTime", Buf().u64(1234567)));
    const Blob data = gvas_file(props);

    const SaveFile save = decode(data);
    const auto& loc = value_of<StructProperty>(save, "Location");
    CHECK(std::get<Vector3d>(loc.value) == Vector3d{1.0, -2.0, 3.5});
    CHECK(guid_value(*find_property(save.properties, "Owner"))
          == Guid::parse("0a0b0c0d-0000-0000-0000-000000000001"));
    const auto& tint = std::get<Color>(value_of<StructProperty>(save, "Tint").value);
    CHECK(tint.b == 10);
    CHECK(tint.g == 20);
    CHECK(tint.r == 30);
    CHECK(tint.a == 255);
    CHECK(std::get<DateTime>(value_of<StructProperty>(save, "When").value).ticks == 1234567);
    CHECK(write_save(save) == data);
}

TEST_CASE("Unknown struct types are nested property scopes", "[tree]") {
    Buf inner;
    inner.raw(int_prop("A", 1)).raw(str_prop("B", "two"));
    const Blob data = gvas_file(scope_prop("Bag", "PalSomethingParameter", inner));
    const SaveFile save = decode(data);
    const Property* a = find_path(save.properties, "Bag.A");
    REQUIRE(a != nullptr);
    CHECK(std::get<IntProperty>(a->value).value == 1);
    CHECK(write_save(save) == data);
}

TEST_CASE("Unknown property types are kept opaque", "[tree]") {
    Buf props;
    props.raw(prop("Odd", "DelegateProperty", no_id(), Buf().u8(1).u8(2).u8(3).u8(4).u8(5)));
    props.raw(int_prop("After", 3));
    const Blob data = gvas_file(props);

    const SaveFile save = decode(data);
    const auto& o = value_of<OpaqueProperty>(save, "Odd");
    CHECK(o.reason == OpaqueReason::UnknownType);
    CHECK(o.raw == Bytes{1, 2, 3, 4, 5});
    CHECK(type_name(*find_property(save.properties, "Odd")) == "DelegateProperty");
    CHECK(value_of<IntProperty>(save, "After").value == 3);
    CHECK(write_save(save) == data);
}

TEST_CASE("Skipped subtrees are opaque and restored verbatim", "[tree]") {
    Buf body;
    body.raw(int_prop("Hidden", 5)).raw(none());
    Buf props;
    props.raw(struct_prop("WorkSaveData", "PalWorkSaveData", body));
    props.raw(bool_prop("WorldLocation", true));
    const Blob data = gvas_file(scope_prop("worldSaveData", "PalWorldSaveData", props));

    const SaveFile save = decode(data);
    const Property* work = find_path(save.properties, "worldSaveData.WorkSaveData");
    REQUIRE(work != nullptr);
    const auto* o = std::get_if<OpaqueProperty>(&work->value);
    REQUIRE(o != nullptr);
    CHECK(o->reason == OpaqueReason::Skipped);
    CHECK(o->type_name == "StructProperty");
    CHECK(o->inner_type == "PalWorkSaveData");
    CHECK(o->raw == body.data);

    // Bool values live in the tag, so a skip rule never hides them.
    const Property* flag = find_path(save.properties, "worldSaveData.WorldLocation");
    REQUIRE(flag != nullptr);
    CHECK(std::get<BoolProperty>(flag->value).value);

    CHECK(write_save(save) == data);
}

TEST_CASE("Arrays pick their representation from the element type", "[tree]") {
    SECTION("byte blob") {
        const Blob data = gvas_file(byte_array_prop("Blob", Blob{9, 8, 7}));
        const SaveFile save = decode(data);
        const auto& a = value_of<ArrayProperty>(save, "Blob");
        CHECK(std::get<Bytes>(a.value) == Bytes{9, 8, 7});
        CHECK(write_save(save) == data);
    }

    SECTION("scalar elements") {
        Buf body;
        body.u32(3).i32(1).i32(-2).i32(3);
        const Blob data = gvas_file(prop("Ints", "ArrayProperty", Buf().str("IntProperty").u8(0), body));
        const SaveFile save = decode(data);
        const auto& values = std::get<std::vector<Value>>(value_of<ArrayProperty>(save, "Ints").value);
        REQUIRE(values.size() == 3);
        CHECK(std::get<std::int32_t>(values[1]) == -2);
        CHECK(write_save(save) == data);
    }

    SECTION("name elements") {
        Buf body;
        body.u32(2).str("Alpha").str("Beta");
        const Blob data = gvas_file(prop("Names", "ArrayProperty", Buf().str("NameProperty").u8(0), body));
        const SaveFile save = decode(data);
        const auto& values = std::get<std::vector<Value>>(value_of<ArrayProperty>(save, "Names").value);
        REQUIRE(values.size() == 2);
        CHECK(std::get<std::string>(values[0]) == "Alpha");
        CHECK(write_save(save) == data);
    }

    SECTION("unmodelled element type") {
        Buf body;
        body.u32(2).u8(1).u8(2).u8(3);
        const Blob data = gvas_file(prop("Things", "ArrayProperty", Buf().str("InterfaceProperty").u8(0), body));
        const SaveFile save = decode(data);
        const auto& raw = std::get<RawArray>(value_of<ArrayProperty>(save, "Things").value);
        CHECK(raw.count == 2);
        CHECK(raw.raw == Bytes{1, 2, 3});
        CHECK(write_save(save) == data);
    }
}

TEST_CASE("Struct arrays keep their element header", "[tree]") {
    Buf elements;
    elements.f64(1).f64(2).f64(3).f64(4).f64(5).f64(6);
    Buf body;
    body.u32(2).str("Points").str("StructProperty").u64(elements.size()).str("Vector");
    body.guid("99999999-0000-0000-0000-000000000001").u8(0).raw(elements);
    const Blob data = gvas_file(prop("Points", "ArrayProperty", Buf().str("StructProperty").u8(0), body));

    std::vector<std::string> warnings;
    const SaveFile save = decode(data, &warnings);
    CHECK(warnings.empty());
    const auto& sa = std::get<StructArray>(value_of<ArrayProperty>(save, "Points").value);
    CHECK(sa.prop_name == "Points");
    CHECK(sa.type_name == "Vector");
    CHECK(sa.array_id == Guid::parse("99999999-0000-0000-0000-000000000001"));
    CHECK_FALSE(sa.element_id.has_value());
    REQUIRE(sa.values.size() == 2);
    CHECK(std::get<Vector3d>(sa.values[1]) == Vector3d{4, 5, 6});
    CHECK(write_save(save) == data);
}

TEST_CASE("A struct array with a wrong element length is read with a warning", "[tree]") {
    Buf elements;
    elements.f64(1).f64(2).f64(3);
    Buf body;
    body.u32(1).str("P").str("StructProperty").u64(elements.size() + 8).str("Vector").zero_guid().u8(0).raw(elements);
    const Blob data = gvas_file(prop("P", "ArrayProperty", Buf().str("StructProperty").u8(0), body));

    std::vector<std::string> warnings;
    const SaveFile save = decode(data, &warnings);
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].find("element bytes") != std::string::npos);
    CHECK(std::get<StructArray>(value_of<ArrayProperty>(save, "P").value).values.size() == 1);
}

TEST_CASE("Map elements use the struct hints of their path", "[tree]") {
    Buf entries;
    entries.guid("00000000-0000-0000-0000-0000000000aa");
    entries.raw(int_prop("Count", 3)).raw(none());
    const Blob data = gvas_file(map_prop("RewardSaveDataMap", "StructProperty", "StructProperty", 1, entries, 7));

    const SaveFile save = decode(data);
    const auto& m = value_of<MapProperty>(save, "RewardSaveDataMap");
    CHECK(m.key_struct_type == "Guid");
    CHECK(m.value_struct_type.empty());
    CHECK(m.reserved == 7);
    REQUIRE(m.entries.size() == 1);
    const auto& key = std::get<StructValue>(m.entries[0].key);
    CHECK(std::get<Guid>(key) == Guid::parse("00000000-0000-0000-0000-0000000000aa"));
    const auto& value = std::get<PropertyList>(std::get<StructValue>(m.entries[0].value));
    REQUIRE(value.size() == 1);
    CHECK(value[0].name == "Count");
    CHECK(write_save(save) == data);
}

TEST_CASE("Maps with scalar keys and values", "[tree]") {
    Buf entries;
    entries.str("one").i32(1).str("two").i32(2);
    const Blob data = gvas_file(map_prop("Counts", "NameProperty", "IntProperty", 2, entries));
    const SaveFile save = decode(data);
    const auto& m = value_of<MapProperty>(save, "Counts");
    REQUIRE(m.entries.size() == 2);
    CHECK(std::get<std::string>(m.entries[1].key) == "two");
    CHECK(std::get<std::int32_t>(m.entries[1].value) == 2);
    CHECK(write_save(save) == data);
}

TEST_CASE("Sets keep their reserved field", "[tree]") {
    Buf body;
    body.u32(5).u32(2).str("a").str("b");
    const Blob data = gvas_file(prop("Tags", "SetProperty", Buf().str("NameProperty").u8(0), body));
    const SaveFile save = decode(data);
    const auto& s = value_of<SetProperty>(save, "Tags");
    CHECK(s.reserved == 5);
    REQUIRE(s.elements.size() == 2);
    CHECK(write_save(save) == data);
}

TEST_CASE("Nesting depth is bounded", "[tree]") {
    SECTION("at the limit") {
        const Blob data = gvas_file(nested_scopes(kMaxNestingDepth - 1));
        const SaveFile save = decode(data);
        CHECK(write_save(save) == data);
    }

    SECTION("past the limit on read") {
        const Blob data = gvas_file(nested_scopes(kMaxNestingDepth));
        try {
            decode(data);
            FAIL("expected SaveError");
        } catch (const SaveError& e) {
            CHECK(e.kind() == ErrorKind::MalformedTree);
            CHECK(e.path().rfind(".S.S.S", 0) == 0);
        }
    }

    SECTION("past the limit on write") {
        SaveFile save;
        save.properties = nested_tree(kMaxNestingDepth);
        try {
            write_save(save);
            FAIL("expected SaveError");
        } catch (const SaveError& e) {
            CHECK(e.kind() == ErrorKind::InvalidTree);
        }
    }
}

TEST_CASE("Truncated trees report the property path", "[tree]") {
    Blob data = gvas_file(scope_prop("Outer", "Bag", int_prop("Inner", 1)));
    data.resize(data.size() - 12);
    try {
        decode(data);
        FAIL("expected SaveError");
    } catch (const SaveError& e) {
        CHECK(e.kind() == ErrorKind::MalformedTree);
        CHECK(e.path().rfind(".Outer", 0) == 0);
    }
}

TEST_CASE("The writer rejects trees it cannot encode", "[tree]") {
    auto kind_of = [](const SaveFile& save) {
        try {
            write_save(save);
        } catch (const SaveError& e) {
            return e.kind();
        }
        FAIL("expected SaveError");
        return ErrorKind::MalformedTree;
    };

    SECTION("terminator name") {
        SaveFile save;
        save.properties.push_back(NamedProperty{"None", Property{std::nullopt, IntProperty{1}}});
        CHECK(kind_of(save) == ErrorKind::InvalidTree);
    }

    SECTION("struct layout mismatch") {
        StructProperty sp;
        sp.struct_type = "Vector";
        sp.value = PropertyList{};
        SaveFile save;
        save.properties.push_back(NamedProperty{"Where", Property{std::nullopt, sp}});
        CHECK(kind_of(save) == ErrorKind::InvalidTree);
    }

    SECTION("element of the wrong kind") {
        ArrayProperty a;
        a.element_type = "IntProperty";
        a.value = std::vector<Value>{Value{std::string("seven")}};
        SaveFile save;
        save.properties.push_back(NamedProperty{"Ints", Property{std::nullopt, a}});
        CHECK(kind_of(save) == ErrorKind::InvalidTree);
    }

    SECTION("byte blob under another element type") {
        ArrayProperty a;
        a.element_type = "IntProperty";
        a.value = Bytes{1, 2, 3};
        SaveFile save;
        save.properties.push_back(NamedProperty{"Ints", Property{std::nullopt, a}});
        CHECK(kind_of(save) == ErrorKind::InvalidTree);
    }
}

TEST_CASE("Edited values change only their own bytes", "[tree]") {
    Buf props;
    props.raw(int_prop("A", 1)).raw(str_prop("Name", "old")).raw(int_prop("B", 2));
    SaveFile save = decode(gvas_file(props));
    std::get<StrProperty>(find_property(save.properties, "Name")->value).value = "a longer name";

    Buf expected;
    expected.raw(int_prop("A", 1)).raw(str_prop("Name", "a longer name")).raw(int_prop("B", 2));
    CHECK(write_save(save) == gvas_file(expected));
}

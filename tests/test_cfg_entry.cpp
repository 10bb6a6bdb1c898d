/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <doctest/doctest.h>
#include "cfg/cfg_entry.h"
#include "cfg/cfg_error.h"
#include "test_helpers.h"

using namespace nxcfg::cfg;
using namespace nxcfg::test;

TEST_CASE("Type tags form a closed set") {
    CHECK(try_parse_type_tag(0x01) == TypeTag::String);
    CHECK(try_parse_type_tag(0x02) == TypeTag::U8);
    CHECK(try_parse_type_tag(0x03) == TypeTag::U32);
    CHECK(try_parse_type_tag(0x04) == TypeTag::Bool);
    CHECK(try_parse_type_tag(0x05) == TypeTag::U64);
    CHECK(try_parse_type_tag(0x06) == TypeTag::HexBlob);
    CHECK_FALSE(try_parse_type_tag(0x00).has_value());
    CHECK_FALSE(try_parse_type_tag(0x07).has_value());
    CHECK_FALSE(try_parse_type_tag(0xFF).has_value());

    CHECK(type_tag_name(TypeTag::HexBlob) == "HexBlob");
    CHECK(fixed_width(TypeTag::U64) == std::optional<std::size_t>(8));
    CHECK_FALSE(fixed_width(TypeTag::String).has_value());
}

TEST_CASE("Entry values carry the shape of their tag") {
    const auto v32 = entry_value(make_entry("a", "b", TypeTag::U32, {0x01, 0x02, 0x00, 0x00}));
    REQUIRE(std::holds_alternative<std::uint32_t>(v32));
    CHECK(std::get<std::uint32_t>(v32) == 0x0201u);

    const auto vbool = entry_value(make_entry("a", "b", TypeTag::Bool, {0x80}));
    REQUIRE(std::holds_alternative<bool>(vbool));
    CHECK(std::get<bool>(vbool));

    const auto vstr = entry_value(make_entry("a", "b", TypeTag::String, bytes_of(std::string("x\0", 2))));
    REQUIRE(std::holds_alternative<std::string>(vstr));
    CHECK(std::get<std::string>(vstr) == "x");

    const auto vblob = entry_value(make_entry("a", "b", TypeTag::HexBlob, {0x00}));
    REQUIRE(std::holds_alternative<HexBlob>(vblob));
    CHECK(std::get<HexBlob>(vblob).bytes == std::vector<std::uint8_t>{0x00});

    CHECK_THROWS_AS(entry_value(make_entry("a", "b", TypeTag::U64, {0x01})), CfgError);
}

TEST_CASE("Error kinds have stable names") {
    CHECK(error_kind_name(ErrorKind::TruncatedInput) == "TruncatedInput");
    CHECK(error_kind_name(ErrorKind::UnknownTypeTag) == "UnknownTypeTag");
    CHECK(error_kind_name(ErrorKind::MalformedEntryName) == "MalformedEntryName");
    CHECK(error_kind_name(ErrorKind::PayloadLengthMismatch) == "PayloadLengthMismatch");
    CHECK(error_kind_name(ErrorKind::InternalRenderError) == "InternalRenderError");
}

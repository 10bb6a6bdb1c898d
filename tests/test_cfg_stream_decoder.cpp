/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <doctest/doctest.h>
#include "cfg/cfg_error.h"
#include "cfg/cfg_section_renderer.h"
#include "cfg/cfg_stream_decoder.h"
#include "test_helpers.h"

using namespace nxcfg::cfg;
using namespace nxcfg::test;

static std::vector<std::uint8_t>
stream_record(const std::string& name, std::uint8_t tag, const std::vector<std::uint8_t>& value) {
    std::vector<std::uint8_t> out;
    append_u32(out, static_cast<std::uint32_t>(name.size() + 1));
    out.insert(out.end(), name.begin(), name.end());
    out.push_back(0);
    out.push_back(tag);
    append_u32(out, static_cast<std::uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
    return out;
}

static std::vector<std::uint8_t> stream_blob(const std::vector<std::vector<std::uint8_t>>& records) {
    std::vector<std::uint8_t> body;
    for (const auto& rec : records) {
        body.insert(body.end(), rec.begin(), rec.end());
    }
    std::vector<std::uint8_t> out;
    append_u32(out, static_cast<std::uint32_t>(body.size() + 4));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

static ErrorKind stream_error_kind(const std::vector<std::uint8_t>& blob) {
    try {
        (void)decode_stream(blob);
    } catch (const CfgError& e) {
        return e.kind();
    }
    FAIL("decode_stream accepted a malformed stream");
    return ErrorKind::InternalRenderError;
}

TEST_CASE("Settings stream decodes owners, names and values") {
    const auto blob = stream_blob({
        stream_record("eupld!upload_enabled", 0x02, {0x00}),
        stream_record("ro!ease_nro_restriction", 0x02, {0x01}),
        stream_record("eupld!host", 0x01, bytes_of(std::string("receiver.example\0", 17))),
        stream_record("bgtc!battery_threshold", 0x03, {0x14, 0x00, 0x00, 0x00}),
    });

    const auto entries = decode_stream(blob);
    REQUIRE(entries.size() == 4);
    CHECK(entries[0].category == "eupld");
    CHECK(entries[0].key == "upload_enabled");
    CHECK(entries[2].type == TypeTag::String);

    CHECK(
        render_sections(entries, RenderStyle::Typed)
        == "[eupld]\n"
           "upload_enabled = u8!0x0\n"
           "host = str!\"receiver.example\"\n"
           "\n"
           "[ro]\n"
           "ease_nro_restriction = u8!0x1\n"
           "\n"
           "[bgtc]\n"
           "battery_threshold = u32!0x14\n"
    );
    CHECK(
        render_sections(entries)
        == "[eupld]\n"
           "upload_enabled = 0\n"
           "host = receiver.example\n"
           "\n"
           "[ro]\n"
           "ease_nro_restriction = 1\n"
           "\n"
           "[bgtc]\n"
           "battery_threshold = 20\n"
    );
}

TEST_CASE("Stream size header must match the buffer") {
    auto blob = stream_blob({stream_record("a!b", 0x02, {0x01})});
    blob.push_back(0);
    CHECK(stream_error_kind(blob) == ErrorKind::InvalidHeader);

    blob = stream_blob({stream_record("a!b", 0x02, {0x01})});
    blob.pop_back();
    CHECK(stream_error_kind(blob) == ErrorKind::TruncatedInput);

    CHECK(stream_error_kind({0x04, 0x00}) == ErrorKind::TruncatedInput);
}

TEST_CASE("Record running past the declared size is TruncatedInput") {
    auto blob = stream_blob({stream_record("a!b", 0x01, bytes_of("value"))});
    blob[blob.size() - 6] = 0x20;
    CHECK(stream_error_kind(blob) == ErrorKind::TruncatedInput);
}

TEST_CASE("Malformed stream names are rejected") {
    CHECK(stream_error_kind(stream_blob({stream_record("noowner", 0x02, {0x01})}))
          == ErrorKind::MalformedEntryName);

    std::vector<std::uint8_t> zero_name;
    append_u32(zero_name, 0);
    CHECK(stream_error_kind(stream_blob({zero_name})) == ErrorKind::MalformedEntryName);

    auto embedded = stream_record("a!b", 0x02, {0x01});
    embedded[5] = 0;
    CHECK(stream_error_kind(stream_blob({embedded})) == ErrorKind::MalformedEntryName);
}

TEST_CASE("Unknown stream type tag is UnknownTypeTag") {
    CHECK(stream_error_kind(stream_blob({stream_record("a!b", 0x07, {0x01})}))
          == ErrorKind::UnknownTypeTag);
}

TEST_CASE("Stream integer widths are enforced") {
    CHECK(stream_error_kind(stream_blob({stream_record("a!b", 0x03, {0x01, 0x02, 0x03})}))
          == ErrorKind::PayloadLengthMismatch);
    CHECK(stream_error_kind(stream_blob({stream_record("a!b", 0x02, {})}))
          == ErrorKind::PayloadLengthMismatch);
}

TEST_CASE("Stream with only a size header has no entries") {
    CHECK(decode_stream(stream_blob({})).empty());
}

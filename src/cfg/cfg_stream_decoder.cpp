/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_stream_decoder.h"
#include "cfg/cfg_byte_reader.h"
#include "cfg/cfg_error.h"
#include "cfg/cfg_name.h"

#include <cstdio>
#include <string>

namespace nxcfg::cfg {
namespace {
std::string at_offset(std::size_t offset) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "offset 0x%zX", offset);
    return buf;
}
}  // namespace

std::vector<Entry> decode_stream(std::span<const std::uint8_t> bytes) {
    ByteReader br(bytes);
    const std::uint32_t total_size = br.read_u32();
    if (total_size > bytes.size()) {
        throw CfgError(
            ErrorKind::TruncatedInput,
            "Settings stream declares " + std::to_string(total_size) + " bytes but only "
                + std::to_string(bytes.size()) + " are present"
        );
    }
    if (total_size != bytes.size()) {
        throw CfgError(
            ErrorKind::InvalidHeader,
            "File size in header (" + std::to_string(total_size)
                + ") doesn't match actual size (" + std::to_string(bytes.size()) + ")"
        );
    }

    std::vector<Entry> out;
    while (!br.at_end()) {
        const std::size_t entry_offset = br.position();

        const std::uint32_t name_size = br.read_u32();
        if (name_size == 0) {
            throw CfgError(
                ErrorKind::MalformedEntryName,
                "Empty name for config entry at " + at_offset(entry_offset)
            );
        }
        const std::string_view name = strip_name_padding(br.read_span(name_size));
        if (name.size() != name_size - 1) {
            throw CfgError(
                ErrorKind::MalformedEntryName,
                "Invalid stringified name length for config entry at " + at_offset(entry_offset)
            );
        }
        auto split = split_entry_name(name);

        const std::uint8_t raw_tag = br.read_u8();
        const std::uint32_t value_size = br.read_u32();
        auto value = br.read_bytes(value_size);

        const auto tag = try_parse_type_tag(raw_tag);
        if (!tag.has_value()) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(raw_tag));
            throw CfgError(
                ErrorKind::UnknownTypeTag,
                "Unknown config value type for entry at " + at_offset(entry_offset) + " ("
                    + buf + ")"
            );
        }
        if (const auto width = fixed_width(*tag); width.has_value() && value.size() != *width) {
            throw CfgError(
                ErrorKind::PayloadLengthMismatch,
                "Invalid " + std::string(type_tag_name(*tag)) + " value size "
                    + std::to_string(value.size()) + " for config entry at "
                    + at_offset(entry_offset)
            );
        }

        Entry entry{};
        entry.category = std::move(split.category);
        entry.key = std::move(split.key);
        entry.type = *tag;
        entry.raw_payload = std::move(value);
        out.push_back(std::move(entry));
    }
    return out;
}
}  // namespace nxcfg::cfg

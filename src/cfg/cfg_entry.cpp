/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_entry.h"
#include "cfg/cfg_error.h"

#include <cstdio>

namespace nxcfg::cfg {
namespace {
std::uint64_t read_le(const std::vector<std::uint8_t>& buf, std::size_t width) {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < width; i++) {
        v |= static_cast<std::uint64_t>(buf[i]) << (8 * i);
    }
    return v;
}

std::string tag_hex(TypeTag tag) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(tag));
    return buf;
}

void require_width(const Entry& entry, std::size_t width) {
    if (entry.raw_payload.size() != width) {
        throw CfgError(
            ErrorKind::InternalRenderError,
            "Entry " + entry.category + "!" + entry.key + " holds "
                + std::to_string(entry.raw_payload.size()) + " byte(s) for a "
                + std::to_string(width) + "-byte " + std::string(type_tag_name(entry.type))
        );
    }
}
}  // namespace

std::optional<TypeTag> try_parse_type_tag(std::uint8_t raw) {
    switch (raw) {
        case static_cast<std::uint8_t>(TypeTag::String):
        case static_cast<std::uint8_t>(TypeTag::U8):
        case static_cast<std::uint8_t>(TypeTag::U32):
        case static_cast<std::uint8_t>(TypeTag::Bool):
        case static_cast<std::uint8_t>(TypeTag::U64):
        case static_cast<std::uint8_t>(TypeTag::HexBlob):
            return static_cast<TypeTag>(raw);
        default:
            return std::nullopt;
    }
}

std::string_view type_tag_name(TypeTag tag) {
    switch (tag) {
        case TypeTag::String:
            return "String";
        case TypeTag::U8:
            return "U8";
        case TypeTag::U32:
            return "U32";
        case TypeTag::Bool:
            return "Bool";
        case TypeTag::U64:
            return "U64";
        case TypeTag::HexBlob:
            return "HexBlob";
    }
    return "Unknown";
}

std::optional<std::size_t> fixed_width(TypeTag tag) {
    switch (tag) {
        case TypeTag::U8:
        case TypeTag::Bool:
            return 1;
        case TypeTag::U32:
            return 4;
        case TypeTag::U64:
            return 8;
        default:
            return std::nullopt;
    }
}

EntryValue entry_value(const Entry& entry) {
    switch (entry.type) {
        case TypeTag::String: {
            std::string text(entry.raw_payload.begin(), entry.raw_payload.end());
            while (!text.empty() && text.back() == '\0') {
                text.pop_back();
            }
            return text;
        }
        case TypeTag::Bool:
            require_width(entry, 1);
            return entry.raw_payload[0] != 0;
        case TypeTag::U8:
            require_width(entry, 1);
            return entry.raw_payload[0];
        case TypeTag::U32:
            require_width(entry, 4);
            return static_cast<std::uint32_t>(read_le(entry.raw_payload, 4));
        case TypeTag::U64:
            require_width(entry, 8);
            return read_le(entry.raw_payload, 8);
        case TypeTag::HexBlob:
            return HexBlob{entry.raw_payload};
    }
    throw CfgError(
        ErrorKind::InternalRenderError,
        "Entry " + entry.category + "!" + entry.key + " has unknown type tag " + tag_hex(entry.type)
    );
}
}  // namespace nxcfg::cfg

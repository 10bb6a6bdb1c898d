/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace nxcfg::cfg {
enum class TypeTag : std::uint8_t {
    String = 0x01,
    U8 = 0x02,
    U32 = 0x03,
    Bool = 0x04,
    U64 = 0x05,
    HexBlob = 0x06,
};

// One decoded settings record. The payload is owned, never a view into the input.
struct Entry {
    std::string category;
    std::string key;
    TypeTag type = TypeTag::String;
    std::vector<std::uint8_t> raw_payload;

    bool operator==(const Entry&) const = default;
};

struct HexBlob {
    std::vector<std::uint8_t> bytes;

    bool operator==(const HexBlob&) const = default;
};

using EntryValue =
    std::variant<std::string, bool, std::uint8_t, std::uint32_t, std::uint64_t, HexBlob>;

std::optional<TypeTag> try_parse_type_tag(std::uint8_t raw);
std::string_view type_tag_name(TypeTag tag);

// Payload width for fixed-width tags, nullopt for String/HexBlob.
std::optional<std::size_t> fixed_width(TypeTag tag);

// Throws CfgError(InternalRenderError) when the entry breaks the decoder's guarantees.
EntryValue entry_value(const Entry& entry);
}  // namespace nxcfg::cfg

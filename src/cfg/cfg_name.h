/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace nxcfg::cfg {
// Separates the owning category from the key inside a raw entry name.
inline constexpr char kNameSeparator = '!';

struct EntryName {
    std::string category;
    std::string key;
};

// Bytes of a NUL-padded name field up to the first NUL.
std::string_view strip_name_padding(std::span<const std::uint8_t> field);

EntryName split_entry_name(std::string_view name);
}  // namespace nxcfg::cfg

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_name.h"
#include "cfg/cfg_error.h"

namespace nxcfg::cfg {
std::string_view strip_name_padding(std::span<const std::uint8_t> field) {
    std::size_t len = 0;
    while (len < field.size() && field[len] != 0) {
        len++;
    }
    return std::string_view(reinterpret_cast<const char*>(field.data()), len);
}

EntryName split_entry_name(std::string_view name) {
    const std::size_t pos = name.find(kNameSeparator);
    if (pos == std::string_view::npos) {
        throw CfgError(
            ErrorKind::MalformedEntryName,
            "Entry name \"" + std::string(name) + "\" doesn't hold a category"
        );
    }
    if (pos == 0 || pos + 1 == name.size()) {
        throw CfgError(
            ErrorKind::MalformedEntryName,
            "Entry name \"" + std::string(name) + "\" has an empty category or key"
        );
    }
    return EntryName{std::string(name.substr(0, pos)), std::string(name.substr(pos + 1))};
}
}  // namespace nxcfg::cfg

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg_entry.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace nxcfg::cfg {
enum class RenderStyle {
    // key = value, unquoted strings, true/false, decimal integers, lowercase hex blobs
    Plain,
    // key = str!"value" / u8!0x1 / u32!0x4 / u64!0x10 / hex!00ff
    Typed,
};

std::string render_value(const Entry& entry, RenderStyle style = RenderStyle::Plain);

/**
 * Groups entries into [category] sections in first-seen order and renders one
 * "key = value" line per entry. Sections are separated by a single blank line and
 * the output has no trailing blank line.
 */
std::string
render_sections(const std::vector<Entry>& entries, RenderStyle style = RenderStyle::Plain);

nlohmann::ordered_json render_json(const std::vector<Entry>& entries);

// Indented JSON text. String bytes that are not valid UTF-8 become U+FFFD.
std::string render_json_text(const std::vector<Entry>& entries);
}  // namespace nxcfg::cfg

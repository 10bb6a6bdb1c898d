/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_section_renderer.h"

#include <cstdio>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace nxcfg::cfg {
namespace {
struct Section {
    std::string name;
    std::vector<std::pair<std::string, std::string>> lines;
};

std::string to_hex_bytes(const std::vector<std::uint8_t>& bytes) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

std::string typed_int(std::string_view prefix, std::uint64_t v) {
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%llX", static_cast<unsigned long long>(v));
    return std::string(prefix) + "!" + buf;
}

std::string render_plain(const EntryValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, HexBlob>) {
                return to_hex_bytes(v.bytes);
            } else {
                return std::to_string(static_cast<std::uint64_t>(v));
            }
        },
        value
    );
}

std::string render_typed(const EntryValue& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return "str!\"" + v + "\"";
            } else if constexpr (std::is_same_v<T, bool>) {
                return typed_int("u8", v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::uint8_t>) {
                return typed_int("u8", v);
            } else if constexpr (std::is_same_v<T, std::uint32_t>) {
                return typed_int("u32", v);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                return typed_int("u64", v);
            } else {
                return "hex!" + to_hex_bytes(v.bytes);
            }
        },
        value
    );
}
}  // namespace

std::string render_value(const Entry& entry, RenderStyle style) {
    const EntryValue value = entry_value(entry);
    return style == RenderStyle::Typed ? render_typed(value) : render_plain(value);
}

std::string render_sections(const std::vector<Entry>& entries, RenderStyle style) {
    std::vector<Section> sections;
    std::unordered_map<std::string, std::size_t> index_by_name;
    for (const auto& entry : entries) {
        auto it = index_by_name.find(entry.category);
        if (it == index_by_name.end()) {
            it = index_by_name.emplace(entry.category, sections.size()).first;
            sections.push_back(Section{entry.category, {}});
        }
        sections[it->second].lines.emplace_back(entry.key, render_value(entry, style));
    }

    std::string out;
    for (std::size_t i = 0; i < sections.size(); i++) {
        if (i > 0) {
            out.push_back('\n');
        }
        out += "[" + sections[i].name + "]\n";
        for (const auto& [key, value] : sections[i].lines) {
            out += key;
            out += " = ";
            out += value;
            out.push_back('\n');
        }
    }
    return out;
}

nlohmann::ordered_json render_json(const std::vector<Entry>& entries) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& entry : entries) {
        if (!out.contains(entry.category)) {
            out[entry.category] = nlohmann::ordered_json::object();
        }
        auto& section = out[entry.category];
        std::visit(
            [&](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, HexBlob>) {
                    section[entry.key] = to_hex_bytes(v.bytes);
                } else {
                    section[entry.key] = v;
                }
            },
            entry_value(entry)
        );
    }
    return out;
}

std::string render_json_text(const std::vector<Entry>& entries) {
    return render_json(entries).dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
           + "\n";
}
}  // namespace nxcfg::cfg

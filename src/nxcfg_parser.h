/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg/cfg_entry.h"
#include "cfg/cfg_section_renderer.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nxcfg::cfg {

enum class InputFormat {
    Auto,
    Table,
    Stream,
};

std::string_view input_format_name(InputFormat format);

// Stream when the leading u32 equals the blob size, Table otherwise.
InputFormat detect_input_format(std::span<const std::uint8_t> bytes);

std::vector<Entry> decode_entries(std::span<const std::uint8_t> bytes, InputFormat format);

struct ParserOptions {
    InputFormat format = InputFormat::Auto;
    RenderStyle style = RenderStyle::Plain;
    bool debug = false;
};

struct DecodeResult {
    std::vector<Entry> entries;
    std::string text;
    nlohmann::ordered_json metadata = nlohmann::ordered_json::object();
};

class SettingsParser {
   public:
    static DecodeResult
    DecodeFile(const std::filesystem::path& path, const ParserOptions& opt = {});
    static DecodeResult DecodeBytes(
        std::span<const std::uint8_t> bytes,
        const ParserOptions& opt = {},
        std::string_view label = {}
    );

    static std::string
    RenderBytes(std::span<const std::uint8_t> bytes, const ParserOptions& opt = {});
};

}  // namespace nxcfg::cfg

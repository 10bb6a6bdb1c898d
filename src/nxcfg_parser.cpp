/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "nxcfg_parser.h"

#include "cfg/cfg_error.h"
#include "cfg/cfg_stream_decoder.h"
#include "cfg/cfg_table_decoder.h"
#include "utils/fs_utils.h"
#include "utils/hash_utils.h"
#include "utils/log.h"

#include <chrono>
#include <unordered_set>

namespace nxcfg::cfg {

static std::size_t count_sections(const std::vector<Entry>& entries) {
    std::unordered_set<std::string> seen;
    for (const auto& entry : entries) {
        seen.insert(entry.category);
    }
    return seen.size();
}

static nlohmann::ordered_json build_metadata_block(
    std::span<const std::uint8_t> bytes,
    InputFormat format,
    const DecodeResult& result,
    std::string_view label
) {
    nlohmann::ordered_json meta = nlohmann::ordered_json::object();
    if (!label.empty()) {
        meta["source"] = std::string(label);
    }
    meta["format"] = std::string(input_format_name(format));
    meta["inputSize"] = bytes.size();
    meta["entryCount"] = result.entries.size();
    meta["sectionCount"] = count_sections(result.entries);
    meta["inputBlake3"] = hash_utils::blake3_hex(bytes);
    meta["textBlake3"] = hash_utils::blake3_hex(std::string_view(result.text));
    return meta;
}

std::string_view input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Auto:
            return "auto";
        case InputFormat::Table:
            return "table";
        case InputFormat::Stream:
            return "stream";
    }
    return "unknown";
}

InputFormat detect_input_format(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < 4) {
        return InputFormat::Table;
    }
    const std::uint32_t lead = static_cast<std::uint32_t>(bytes[0])
                               | (static_cast<std::uint32_t>(bytes[1]) << 8)
                               | (static_cast<std::uint32_t>(bytes[2]) << 16)
                               | (static_cast<std::uint32_t>(bytes[3]) << 24);
    return lead == bytes.size() ? InputFormat::Stream : InputFormat::Table;
}

std::vector<Entry> decode_entries(std::span<const std::uint8_t> bytes, InputFormat format) {
    if (format == InputFormat::Auto) {
        format = detect_input_format(bytes);
    }
    return format == InputFormat::Stream ? decode_stream(bytes) : decode_table(bytes);
}

DecodeResult SettingsParser::DecodeFile(const std::filesystem::path& path, const ParserOptions& opt) {
    const auto bytes = fs_utils::read_file(path);
    if (bytes.empty()) {
        throw CfgError(ErrorKind::TruncatedInput, "Settings file is empty: " + path.string());
    }
    return DecodeBytes(bytes, opt, path.filename().string());
}

DecodeResult SettingsParser::DecodeBytes(
    std::span<const std::uint8_t> bytes,
    const ParserOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    const InputFormat format =
        opt.format == InputFormat::Auto ? detect_input_format(bytes) : opt.format;

    DecodeResult result{};
    result.entries = decode_entries(bytes, format);
    const auto t1 = std::chrono::steady_clock::now();
    result.text = render_sections(result.entries, opt.style);
    const auto t2 = std::chrono::steady_clock::now();
    result.metadata = build_metadata_block(bytes, format, result, label);

    if (opt.debug) {
        const auto decode_us =
            std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        const auto render_us =
            std::chrono::duration_cast<std::chrono::microseconds>(t2 - t1).count();
        NXCFG_LOG_DEBUG(
            "Decode %s: format=%s bytes=%zu entries=%zu decode=%lldus render=%lldus",
            std::string(label).c_str(), std::string(input_format_name(format)).c_str(),
            bytes.size(), result.entries.size(), static_cast<long long>(decode_us),
            static_cast<long long>(render_us)
        );
    }
    return result;
}

std::string SettingsParser::RenderBytes(std::span<const std::uint8_t> bytes, const ParserOptions& opt) {
    return render_sections(decode_entries(bytes, opt.format), opt.style);
}

}  // namespace nxcfg::cfg

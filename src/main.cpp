/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"
#include "cfg/cfg_table_writer.h"

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    nxcfg::cfg::InputFormat format = nxcfg::cfg::InputFormat::Auto;
    bool typed = false;
    bool json = false;
    bool debug = false;
    std::optional<fs::path> out_path;
    std::optional<fs::path> rebuild_path;
};

static void print_usage() {
    NXCFG_LOG_INFO(
        "Usage:\n" \
        "    nxcfg_parser <settings-blob> [--format <auto|table|stream>] [--typed] [--json]\n" \
        "                 [--out <path>] [--rebuild <path>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be the extracted system settings blob\n" \
        "    --format      input layout, auto-detected by default\n" \
        "    --typed       renders values as str!\"...\" / u8!0x.. / u32!0x.. / u64!0x.. / hex!..\n" \
        "    --json        writes a JSON object of sections instead of INI text\n" \
        "    --out         writes the output to <path> instead of stdout\n" \
        "    --rebuild     also writes the decoded entries back in table layout to <path>\n" \
        "    --debug       enables extra logging\n"
    );
}

static std::optional<nxcfg::cfg::InputFormat> parse_format(std::string_view value) {
    if (value == "auto") {
        return nxcfg::cfg::InputFormat::Auto;
    }
    if (value == "table") {
        return nxcfg::cfg::InputFormat::Table;
    }
    if (value == "stream") {
        return nxcfg::cfg::InputFormat::Stream;
    }
    return std::nullopt;
}

static void write_stdout(const std::string& text) {
    if (!text.empty()) {
        std::fwrite(text.data(), 1, text.size(), stdout);
    }
    std::fflush(stdout);
}

static void log_failure(const fs::path& path, const char* stage, const std::exception& e) {
    if (const auto* cfg_error = dynamic_cast<const nxcfg::cfg::CfgError*>(&e)) {
        NXCFG_LOG_ERROR(
            "%s: %s (%s)", std::string(nxcfg::cfg::error_kind_name(cfg_error->kind())).c_str(),
            e.what(), path.string().c_str()
        );
        return;
    }
    NXCFG_LOG_ERROR("%s failed: %s (%s)", stage, path.string().c_str(), e.what());
}

static int process_file(const fs::path& path, const Settings& settings) {
    std::vector<nxcfg::cfg::Entry> entries;
    try {
        nxcfg::cfg::ParserOptions opt{};
        opt.format = settings.format;
        opt.style = settings.typed ? nxcfg::cfg::RenderStyle::Typed : nxcfg::cfg::RenderStyle::Plain;
        opt.debug = settings.debug;
        auto res = nxcfg::cfg::SettingsParser::DecodeFile(path, opt);
        NXCFG_LOG_DEBUG(
            "Metadata: %s",
            res.metadata.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace)
                .c_str()
        );

        const std::string output =
            settings.json ? nxcfg::cfg::render_json_text(res.entries) : res.text;
        if (settings.out_path.has_value()) {
            nxcfg::fs_utils::write_text_file(*settings.out_path, output);
            NXCFG_LOG_INFO("Wrote: %s", settings.out_path->string().c_str());
        } else {
            write_stdout(output);
        }
        entries = std::move(res.entries);
    } catch (const std::exception& e) {
        log_failure(path, "Decode", e);
        return 3;
    }

    // Output is already written at this point.
    if (settings.rebuild_path.has_value()) {
        try {
            const auto table = nxcfg::cfg::build_table(entries);
            nxcfg::fs_utils::write_file(*settings.rebuild_path, table);
            NXCFG_LOG_INFO("Wrote: %s", settings.rebuild_path->string().c_str());
        } catch (const std::exception& e) {
            NXCFG_LOG_ERROR("Rebuild failed: %s (%s)", settings.rebuild_path->string().c_str(), e.what());
            return 4;
        }
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        NXCFG_LOG_ERROR("First argument must be a settings file.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--typed") {
            settings.typed = true;
            continue;
        }
        if (arg == "--json") {
            settings.json = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--format" || arg == "--out" || arg == "--rebuild") {
            if (i + 1 >= argc) {
                NXCFG_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const std::string_view value = argv[++i];
            if (arg == "--format") {
                const auto format = parse_format(value);
                if (!format.has_value()) {
                    NXCFG_LOG_ERROR("Unknown format: %s", std::string(value).c_str());
                    return 2;
                }
                settings.format = *format;
            } else if (arg == "--out") {
                settings.out_path = fs::path(std::string(value));
            } else {
                settings.rebuild_path = fs::path(std::string(value));
            }
            continue;
        }
        NXCFG_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    nxcfg::log::set_debug(settings.debug);

    if (!fs::exists(input) || fs::is_directory(input)) {
        NXCFG_LOG_ERROR("The provided path doesn't exist or points to a directory: %s", input.string().c_str());
        return 2;
    }

    return process_file(input, settings);
}

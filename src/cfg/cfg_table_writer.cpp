/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_table_writer.h"
#include "cfg/cfg_error.h"
#include "cfg/cfg_name.h"
#include "cfg/cfg_table_decoder.h"

#include <cstring>
#include <limits>
#include <string>

namespace nxcfg::cfg {
namespace {
void write_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

void put_u32_le(std::uint8_t* dst, std::uint32_t v) {
    for (int i = 0; i < 4; i++) {
        dst[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

void put_u64_le(std::uint8_t* dst, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        dst[i] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

std::string full_name(const Entry& entry) {
    if (entry.category.empty() || entry.key.empty()
        || entry.category.find(kNameSeparator) != std::string::npos) {
        throw CfgError(
            ErrorKind::InvalidArgument,
            "Entry \"" + entry.category + kNameSeparator + entry.key
                + "\" can't be written back as a name"
        );
    }
    return entry.category + kNameSeparator + entry.key;
}

void check_payload(const Entry& entry) {
    if (!try_parse_type_tag(static_cast<std::uint8_t>(entry.type)).has_value()) {
        throw CfgError(
            ErrorKind::InvalidArgument, "Entry " + full_name(entry) + " has an unknown type tag"
        );
    }
    const auto width = fixed_width(entry.type);
    if (width.has_value() && entry.raw_payload.size() != *width) {
        throw CfgError(
            ErrorKind::InvalidArgument,
            "Entry " + full_name(entry) + " holds " + std::to_string(entry.raw_payload.size())
                + " byte(s) for a " + std::to_string(*width) + "-byte "
                + std::string(type_tag_name(entry.type))
        );
    }
    if (entry.raw_payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw CfgError(ErrorKind::InvalidArgument, "Entry " + full_name(entry) + " is too large");
    }
}
}  // namespace

std::vector<std::uint8_t> build_table(const std::vector<Entry>& entries) {
    const std::size_t table_end = kTableHeaderSize + entries.size() * kEntryRecordSize;

    std::vector<std::uint8_t> records(entries.size() * kEntryRecordSize, 0);
    std::vector<std::uint8_t> data;
    for (std::size_t i = 0; i < entries.size(); i++) {
        const auto& entry = entries[i];
        check_payload(entry);
        const std::string name = full_name(entry);
        if (name.size() >= kEntryNameSize) {
            throw CfgError(
                ErrorKind::InvalidArgument,
                "Entry name " + name + " doesn't fit the " + std::to_string(kEntryNameSize)
                    + "-byte name field"
            );
        }

        std::uint8_t* rec = records.data() + i * kEntryRecordSize;
        std::memcpy(rec, name.data(), name.size());
        rec[kEntryTypeOffset] = static_cast<std::uint8_t>(entry.type);
        put_u32_le(rec + kEntrySizeOffset, static_cast<std::uint32_t>(entry.raw_payload.size()));
        if (fixed_width(entry.type).has_value()) {
            std::memcpy(rec + kEntryValueOffset, entry.raw_payload.data(), entry.raw_payload.size());
        } else {
            put_u64_le(rec + kEntryValueOffset, static_cast<std::uint64_t>(data.size()));
            data.insert(data.end(), entry.raw_payload.begin(), entry.raw_payload.end());
        }
    }

    if (table_end + data.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw CfgError(ErrorKind::InvalidArgument, "Settings table exceeds 4 GiB");
    }

    std::vector<std::uint8_t> out;
    out.reserve(table_end + data.size());
    write_u32_le(out, static_cast<std::uint32_t>(entries.size()));
    write_u32_le(out, static_cast<std::uint32_t>(table_end));
    write_u32_le(out, static_cast<std::uint32_t>(data.size()));
    write_u32_le(out, 0);
    out.insert(out.end(), records.begin(), records.end());
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

std::vector<std::uint8_t> build_stream(const std::vector<Entry>& entries) {
    std::vector<std::uint8_t> out;
    write_u32_le(out, 0);
    for (const auto& entry : entries) {
        check_payload(entry);
        const std::string name = full_name(entry);
        write_u32_le(out, static_cast<std::uint32_t>(name.size() + 1));
        out.insert(out.end(), name.begin(), name.end());
        out.push_back(0);
        out.push_back(static_cast<std::uint8_t>(entry.type));
        write_u32_le(out, static_cast<std::uint32_t>(entry.raw_payload.size()));
        out.insert(out.end(), entry.raw_payload.begin(), entry.raw_payload.end());
    }
    if (out.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw CfgError(ErrorKind::InvalidArgument, "Settings stream exceeds 4 GiB");
    }
    put_u32_le(out.data(), static_cast<std::uint32_t>(out.size()));
    return out;
}
}  // namespace nxcfg::cfg

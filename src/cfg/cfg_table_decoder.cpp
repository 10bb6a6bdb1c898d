/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cfg/cfg_table_decoder.h"
#include "cfg/cfg_byte_reader.h"
#include "cfg/cfg_error.h"
#include "cfg/cfg_name.h"

#include <cstdio>
#include <string>

namespace nxcfg::cfg {
namespace {
std::string hex_u8(std::uint8_t v) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(v));
    return buf;
}

std::string record_label(std::size_t index, std::size_t offset) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "entry #%zu at offset 0x%zX", index, offset);
    return buf;
}

std::vector<std::uint8_t> read_payload(
    std::span<const std::uint8_t> bytes,
    const TableHeader& hdr,
    TypeTag tag,
    std::uint32_t size,
    std::span<const std::uint8_t> value_field,
    const std::string& label
) {
    if (const auto width = fixed_width(tag)) {
        if (size != *width) {
            throw CfgError(
                ErrorKind::PayloadLengthMismatch,
                "Invalid " + std::string(type_tag_name(tag)) + " size " + std::to_string(size)
                    + " for " + label + " (expected " + std::to_string(*width) + ")"
            );
        }
        return std::vector<std::uint8_t>(value_field.begin(), value_field.begin() + *width);
    }

    ByteReader value_reader(value_field);
    const std::uint64_t rel_offset = value_reader.read_u64();
    const std::uint64_t data_start = hdr.data_offset;
    const std::uint64_t room = hdr.data_size;
    if (rel_offset > room || size > room - rel_offset) {
        throw CfgError(
            ErrorKind::TruncatedInput,
            "Value of " + label + " (" + std::to_string(size) + " byte(s) at data offset "
                + std::to_string(rel_offset) + ") runs past end of "
                + std::to_string(hdr.data_size) + "-byte data region"
        );
    }

    ByteReader br(bytes);
    br.seek(static_cast<std::size_t>(data_start + rel_offset));
    return br.read_bytes(size);
}
}  // namespace

TableHeader read_table_header(std::span<const std::uint8_t> bytes) {
    ByteReader br(bytes);
    TableHeader hdr{};
    hdr.entry_count = br.read_u32();
    hdr.data_offset = br.read_u32();
    hdr.data_size = br.read_u32();
    hdr.reserved = br.read_u32();

    const std::size_t max_entries = (bytes.size() - kTableHeaderSize) / kEntryRecordSize;
    if (hdr.entry_count > max_entries) {
        throw CfgError(
            ErrorKind::TruncatedInput,
            "Table declares " + std::to_string(hdr.entry_count) + " entries but "
                + std::to_string(bytes.size()) + "-byte input holds at most "
                + std::to_string(max_entries)
        );
    }

    const std::size_t table_end = kTableHeaderSize + hdr.entry_count * kEntryRecordSize;
    if (hdr.data_offset < table_end) {
        throw CfgError(
            ErrorKind::InvalidHeader,
            "Data region at offset " + std::to_string(hdr.data_offset)
                + " overlaps the entry table ending at " + std::to_string(table_end)
        );
    }

    const std::uint64_t data_end =
        static_cast<std::uint64_t>(hdr.data_offset) + static_cast<std::uint64_t>(hdr.data_size);
    if (data_end > bytes.size()) {
        throw CfgError(
            ErrorKind::TruncatedInput,
            "Data region [" + std::to_string(hdr.data_offset) + ", " + std::to_string(data_end)
                + ") runs past end of " + std::to_string(bytes.size()) + "-byte input"
        );
    }
    return hdr;
}

std::vector<Entry> decode_table(std::span<const std::uint8_t> bytes) {
    const TableHeader hdr = read_table_header(bytes);

    std::vector<Entry> out;
    out.reserve(hdr.entry_count);
    ByteReader br(bytes);
    br.seek(kTableHeaderSize);
    for (std::size_t i = 0; i < hdr.entry_count; i++) {
        const std::size_t record_offset = br.position();
        const std::string label = record_label(i, record_offset);
        const auto record = br.read_span(kEntryRecordSize);

        const std::string_view name = strip_name_padding(record.subspan(0, kEntryNameSize));

        const std::uint8_t raw_tag = record[kEntryTypeOffset];
        const auto tag = try_parse_type_tag(raw_tag);
        if (!tag.has_value()) {
            throw CfgError(
                ErrorKind::UnknownTypeTag,
                "Unknown config value type " + hex_u8(raw_tag) + " for " + label
            );
        }

        ByteReader size_reader(record.subspan(kEntrySizeOffset, 4));
        const std::uint32_t size = size_reader.read_u32();
        auto payload = read_payload(
            bytes, hdr, *tag, size, record.subspan(kEntryValueOffset, kInlineValueSize), label
        );

        auto split = split_entry_name(name);
        Entry entry{};
        entry.category = std::move(split.category);
        entry.key = std::move(split.key);
        entry.type = *tag;
        entry.raw_payload = std::move(payload);
        out.push_back(std::move(entry));
    }
    return out;
}
}  // namespace nxcfg::cfg

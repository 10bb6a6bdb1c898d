/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg/cfg_entry.h"
#include "cfg/cfg_table_decoder.h"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

// Hand-assembled blobs, independent of the table writer.
namespace nxcfg::test {
inline void append_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; i++) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

inline std::vector<std::uint8_t>
table_header(std::uint32_t count, std::uint32_t data_offset, std::uint32_t data_size) {
    std::vector<std::uint8_t> out;
    append_u32(out, count);
    append_u32(out, data_offset);
    append_u32(out, data_size);
    append_u32(out, 0);
    return out;
}

// value holds the inline payload bytes, or the little-endian u64 data offset.
inline std::vector<std::uint8_t> table_record(
    const std::string& name,
    std::uint8_t tag,
    std::uint32_t size,
    const std::vector<std::uint8_t>& value
) {
    std::vector<std::uint8_t> rec(cfg::kEntryRecordSize, 0);
    std::memcpy(rec.data(), name.data(), name.size());
    rec[cfg::kEntryTypeOffset] = tag;
    for (int i = 0; i < 4; i++) {
        rec[cfg::kEntrySizeOffset + i] = static_cast<std::uint8_t>((size >> (8 * i)) & 0xFFu);
    }
    for (std::size_t i = 0; i < value.size() && i < cfg::kInlineValueSize; i++) {
        rec[cfg::kEntryValueOffset + i] = value[i];
    }
    return rec;
}

inline std::vector<std::uint8_t> offset_bytes(std::uint64_t offset) {
    std::vector<std::uint8_t> out;
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::uint8_t>((offset >> (8 * i)) & 0xFFu));
    }
    return out;
}

inline std::vector<std::uint8_t> table_blob(
    const std::vector<std::vector<std::uint8_t>>& records,
    const std::vector<std::uint8_t>& data = {}
) {
    const auto data_offset =
        static_cast<std::uint32_t>(cfg::kTableHeaderSize + records.size() * cfg::kEntryRecordSize);
    auto out = table_header(
        static_cast<std::uint32_t>(records.size()), data_offset,
        static_cast<std::uint32_t>(data.size())
    );
    for (const auto& rec : records) {
        out.insert(out.end(), rec.begin(), rec.end());
    }
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

inline std::vector<std::uint8_t> bytes_of(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline cfg::Entry make_entry(
    const std::string& category,
    const std::string& key,
    cfg::TypeTag type,
    std::vector<std::uint8_t> payload
) {
    cfg::Entry e{};
    e.category = category;
    e.key = key;
    e.type = type;
    e.raw_payload = std::move(payload);
    return e;
}
}  // namespace nxcfg::test

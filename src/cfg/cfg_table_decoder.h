/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg_entry.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace nxcfg::cfg {
inline constexpr std::size_t kTableHeaderSize = 16;
inline constexpr std::size_t kEntryRecordSize = 80;
inline constexpr std::size_t kEntryNameSize = 64;
inline constexpr std::size_t kEntryTypeOffset = 0x40;
inline constexpr std::size_t kEntrySizeOffset = 0x44;
inline constexpr std::size_t kEntryValueOffset = 0x48;
inline constexpr std::size_t kInlineValueSize = 8;

struct TableHeader {
    std::uint32_t entry_count = 0;
    std::uint32_t data_offset = 0;
    std::uint32_t data_size = 0;
    std::uint32_t reserved = 0;
};

// Validates the header against the buffer, including the entry-count sanity bound.
// The data region must start after the entry table and end inside the buffer.
TableHeader read_table_header(std::span<const std::uint8_t> bytes);

// All-or-nothing: throws CfgError on the first malformed record.
std::vector<Entry> decode_table(std::span<const std::uint8_t> bytes);
}  // namespace nxcfg::cfg

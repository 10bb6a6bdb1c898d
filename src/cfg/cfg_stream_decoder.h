/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg_entry.h"

#include <cstdint>
#include <span>
#include <vector>

namespace nxcfg::cfg {
// Length-prefixed record stream:
//   u32 total_size
//   { u32 name_size, char name[name_size] (NUL-terminated), u8 type, u32 value_size,
//     u8 value[value_size] } until total_size
std::vector<Entry> decode_stream(std::span<const std::uint8_t> bytes);
}  // namespace nxcfg::cfg

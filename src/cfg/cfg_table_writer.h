/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "cfg_entry.h"

#include <cstdint>
#include <vector>

namespace nxcfg::cfg {
// Fixed-record table layout; referenced payloads are packed into the data region in entry order.
std::vector<std::uint8_t> build_table(const std::vector<Entry>& entries);

// Length-prefixed record stream with a leading u32 total size.
std::vector<std::uint8_t> build_stream(const std::vector<Entry>& entries);
}  // namespace nxcfg::cfg

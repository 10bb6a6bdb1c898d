/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace nxcfg::hash_utils {
std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload);

// Lowercase hex digest, used to compare rendered output against a reference dump.
std::string blake3_hex(std::span<const std::uint8_t> payload);
std::string blake3_hex(std::string_view text);
}  // namespace nxcfg::hash_utils

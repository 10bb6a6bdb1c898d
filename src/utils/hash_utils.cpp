/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "hash_utils.h"

#include <blake3.h>

namespace nxcfg::hash_utils {
std::array<std::uint8_t, 32> blake3_hash32(std::span<const std::uint8_t> payload) {
    std::array<std::uint8_t, 32> out{};
    blake3_hasher h{};
    blake3_hasher_init(&h);
    if (!payload.empty()) {
        blake3_hasher_update(&h, payload.data(), payload.size());
    }
    blake3_hasher_finalize(&h, out.data(), out.size());
    return out;
}

std::string blake3_hex(std::span<const std::uint8_t> payload) {
    static const char hexdig[] = "0123456789abcdef";
    const auto digest = blake3_hash32(payload);
    std::string out;
    out.reserve(digest.size() * 2);
    for (const auto b : digest) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

std::string blake3_hex(std::string_view text) {
    return blake3_hex(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()), text.size()
    ));
}
}  // namespace nxcfg::hash_utils

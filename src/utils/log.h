/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace nxcfg::log {
void set_debug(bool enabled);
bool debug_enabled();

void info(const char* fmt, ...);
void error(const char* fmt, ...);
void debug(const char* fmt, ...);
}  // namespace nxcfg::log

#define NXCFG_LOG_INFO(fmt, ...) ::nxcfg::log::info(fmt, ##__VA_ARGS__)
#define NXCFG_LOG_ERROR(fmt, ...) ::nxcfg::log::error(fmt, ##__VA_ARGS__)
#define NXCFG_LOG_DEBUG(fmt, ...)                    \
    do {                                             \
        if (::nxcfg::log::debug_enabled()) {         \
            ::nxcfg::log::debug(fmt, ##__VA_ARGS__); \
        }                                            \
    } while (0)

/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"
#include <cstdio>

namespace {
bool g_debug = false;

void vprint(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

namespace nxcfg::log {
void set_debug(bool enabled) {
    g_debug = enabled;
}

bool debug_enabled() {
    return g_debug;
}

// stdout carries the rendered settings, so informational lines go to stderr as well.
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprint(stderr, "[DEBUG] ", fmt, args);
    va_end(args);
}
}  // namespace nxcfg::log

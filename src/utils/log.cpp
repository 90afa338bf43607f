/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"
#include <cstdio>

namespace {
void emit_line(FILE* f, const char* prefix, const char* fmt, va_list args) {
    std::fputs(prefix, f);
    std::vfprintf(f, fmt, args);
    std::fputc('\n', f);
    std::fflush(f);
}
}  // namespace

namespace palsav::log {
void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit_line(stdout, "", fmt, args);
    va_end(args);
}

// Warnings go to stderr so JSON written to stdout stays clean.
void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit_line(stderr, "[WARN] ", fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit_line(stderr, "[ERROR] ", fmt, args);
    va_end(args);
}
}  // namespace palsav::log

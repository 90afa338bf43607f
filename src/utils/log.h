/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace palsav::log {
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace palsav::log

#define PALSAV_LOG_INFO(fmt, ...) ::palsav::log::info(fmt, ##__VA_ARGS__)
#define PALSAV_LOG_WARN(fmt, ...) ::palsav::log::warn(fmt, ##__VA_ARGS__)
#define PALSAV_LOG_ERROR(fmt, ...) ::palsav::log::error(fmt, ##__VA_ARGS__)

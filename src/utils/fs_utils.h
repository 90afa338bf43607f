/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace palsav::fs_utils {
std::filesystem::path executable_dir();
bool is_supported_input(const std::filesystem::path& path);
// .sav and .json files under `root`, sorted.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace palsav::fs_utils

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace treehop::fs {

bool exists(const std::filesystem::path& p);
bool is_directory(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);

// Whole file as text; std::nullopt if it cannot be opened.
std::optional<std::string> read_text(const std::filesystem::path& p);

std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace treehop::fs

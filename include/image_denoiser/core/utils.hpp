#pragma once

#include "types.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace image_denoiser::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string make_request_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);
void write_text(const fs::path& path, const std::string& text);

// Math utilities
float median_of(std::vector<float>& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);

} // namespace image_denoiser::core

#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace floodmap::core {

namespace fs = std::filesystem;

// UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
std::string get_iso_timestamp();

// Local time stamp plus 8 random hex digits; used as the run directory name
std::string get_run_id();

std::vector<uint8_t> read_bytes(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Lowercase hex digests
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

} // namespace floodmap::core

#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace image_collate::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<fs::path> list_images(const fs::path& dir, const std::vector<std::string>& extensions);
std::vector<fs::path> list_subdirectories(const fs::path& dir);
bool has_extension(const fs::path& path, const std::vector<std::string>& extensions);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Hash utilities
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string replace_all(std::string str, const std::string& from, const std::string& to);
std::string shell_quote(const std::string& s);

} // namespace image_collate::core

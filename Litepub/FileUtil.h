#pragma once

#include <filesystem>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

// Whole file as bytes. Throws ConversionError if it cannot be opened or read.
std::string read_file(const fs::path& path);

// Writes `data` to a temporary file next to `path` and renames it into place,
// so readers see either the old file or the complete new one. On failure the
// temporary file is removed and ConversionError is thrown.
void write_file_atomic(const fs::path& path, const std::string& data);

// True if `s` starts with `prefix`, ignoring ASCII case.
bool starts_with_icase(const std::string& s, const std::string& prefix);

// True if `s` ends with `suffix`, ignoring ASCII case.
bool ends_with_icase(const std::string& s, const std::string& suffix);

std::string to_lower(std::string s);

} // namespace litepub

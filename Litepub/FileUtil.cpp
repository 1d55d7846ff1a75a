#include "FileUtil.h"
#include "ConversionError.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace litepub {

namespace {

std::atomic<unsigned long> g_temp_counter{0};

fs::path temp_path_for(const fs::path& path) {
    std::string name = "." + path.filename().string() + ".tmp." +
        std::to_string(::getpid()) + "." + std::to_string(++g_temp_counter);
    return path.parent_path() / name;
}

} // namespace

std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw ConversionError("Could not open " + path.string());
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    if (ifs.bad()) {
        throw ConversionError("Could not read " + path.string());
    }
    return oss.str();
}

void write_file_atomic(const fs::path& path, const std::string& data) {
    const fs::path tmp = temp_path_for(path);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw ConversionError("Could not create " + tmp.string());
        }
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.close();
        if (!ofs) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw ConversionError("Could not write " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ConversionError("Could not replace " + path.string() + ": " + ec.message());
    }
}

bool starts_with_icase(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), s.begin(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
}

bool ends_with_icase(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    return std::equal(suffix.begin(), suffix.end(), s.end() - suffix.size(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace litepub

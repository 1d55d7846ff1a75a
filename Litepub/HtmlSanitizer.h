#pragma once

#include <array>
#include <filesystem>
#include <mutex>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

// Existence and modification time of one side of the sanitize cache.
struct CacheStamp {
    bool exists = false;
    fs::file_time_type mtime{};
};

enum class CacheDecision { UseCached, Regenerate, SourceMissing };

// The sanitized sibling is reused while it exists and is not older than its
// source.
CacheDecision decide_cache(const CacheStamp& source, const CacheStamp& derived);

CacheStamp stat_stamp(const fs::path& path);

// "<dir>/<stem>.xhtml" for a source document.
fs::path sanitized_path_for(const fs::path& html_path);

// Converts raw HTML into the minimal XHTML document: drops script, style,
// nav, footer and iframe, keeps the main content block and the title.
// Throws ConversionError if the input is not valid UTF-8.
std::string sanitize_html(const std::string& html, const std::string& url = "");

class HtmlSanitizer {
public:
    // Returns the up-to-date sanitized sibling of `html_path`, regenerating
    // it when missing or stale. Throws ConversionError.
    fs::path sanitize(const fs::path& html_path) const;

private:
    // Striped per-destination locks, so one source is converted once even
    // when several requests for it arrive together.
    static constexpr std::size_t LOCK_STRIPES = 64;
    mutable std::array<std::mutex, LOCK_STRIPES> locks_;
};

} // namespace litepub

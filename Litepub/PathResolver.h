#pragma once

#include <filesystem>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

// What a request path maps to inside the content root.
struct ResolvedTarget {
    enum class Kind { NotFound, Directory, File };

    Kind kind = Kind::NotFound;
    fs::path path;

    bool found() const { return kind != Kind::NotFound; }
};

// Index pages tried, in order, when a directory is requested.
extern const char* const INDEX_CANDIDATES[3];

// `candidate` equals `root` or lies below it. Both must already be canonical;
// the comparison is per path component, so "/srv/root2" is not inside "/srv/root".
bool is_within_root(const fs::path& root, const fs::path& candidate);

// Canonical form of `root / relative`, or an empty path if it cannot be
// resolved or leaves the root.
fs::path confine_path(const fs::path& root, const fs::path& relative);

// Maps an untrusted, already URL-decoded request path onto the content root.
// `content_root` must be canonical. Paths that escape the root, touch a
// dotfile or do not exist all report NotFound alike. Directories resolve to
// their first index page, or to Directory when none exists. A ".epub" request
// answers with the matching .html/.htm source, else the .xhtml file.
ResolvedTarget resolve_request_path(const fs::path& content_root, const std::string& raw_path);

} // namespace litepub

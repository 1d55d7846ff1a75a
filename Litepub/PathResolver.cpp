#include "PathResolver.h"
#include "FileUtil.h"

#include <iterator>
#include <system_error>

namespace litepub {

const char* const INDEX_CANDIDATES[3] = {"index.xhtml", "index.html", "index.htm"};

namespace {

bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

// Canonical path of an existing regular file inside the root, else empty.
// Index pages and alias siblings may be symlinks, so they are checked again.
fs::path confined_regular(const fs::path& root, const fs::path& p) {
    if (!is_regular(p)) return {};
    std::error_code ec;
    fs::path canonical = fs::canonical(p, ec);
    if (ec || !is_within_root(root, canonical)) return {};
    return canonical;
}

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

// Any component below the root that starts with '.'
bool has_hidden_component(const fs::path& root, const fs::path& canonical) {
    auto rel = canonical.lexically_relative(root);
    for (const auto& part : rel) {
        const std::string s = part.string();
        if (s != "." && !s.empty() && s[0] == '.') return true;
    }
    return false;
}

ResolvedTarget not_found() {
    return ResolvedTarget{};
}

ResolvedTarget file(const fs::path& p) {
    return ResolvedTarget{ResolvedTarget::Kind::File, p};
}

// foo.epub -> foo.html / foo.htm (source to sanitize) -> foo.xhtml
ResolvedTarget resolve_epub_alias(const fs::path& root, const fs::path& requested) {
    fs::path xhtml = requested;
    xhtml.replace_extension(".xhtml");
    for (const char* ext : {".html", ".htm"}) {
        fs::path source = xhtml;
        source.replace_extension(ext);
        fs::path found = confined_regular(root, source);
        if (!found.empty()) {
            return file(found);
        }
    }
    fs::path found = confined_regular(root, xhtml);
    if (found.empty()) {
        return not_found();
    }
    return file(found);
}

} // namespace

bool is_within_root(const fs::path& root, const fs::path& candidate) {
    auto r = root.begin();
    auto c = candidate.begin();
    for (; r != root.end(); ++r, ++c) {
        // A trailing separator on the root shows up as an empty last element
        if (r->empty() && std::next(r) == root.end()) break;
        if (c == candidate.end() || *r != *c) return false;
    }
    return true;
}

fs::path confine_path(const fs::path& root, const fs::path& relative) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(root / relative, ec);
    if (ec || !is_within_root(root, canonical)) {
        return {};
    }
    return canonical;
}

ResolvedTarget resolve_request_path(const fs::path& content_root, const std::string& raw_path) {
    if (raw_path.find('\0') != std::string::npos) {
        return not_found();
    }

    // Leading slashes would make the join absolute and drop the root
    std::string relative = raw_path;
    relative.erase(0, relative.find_first_not_of('/'));

    fs::path target = confine_path(content_root, fs::u8path(relative));
    if (target.empty() || has_hidden_component(content_root, target)) {
        return not_found();
    }

    if (is_dir(target)) {
        for (const char* index_name : INDEX_CANDIDATES) {
            fs::path candidate = confined_regular(content_root, target / index_name);
            if (!candidate.empty()) {
                return file(candidate);
            }
        }
        return ResolvedTarget{ResolvedTarget::Kind::Directory, target};
    }

    if (ends_with_icase(target.filename().string(), ".epub")) {
        return resolve_epub_alias(content_root, target);
    }

    if (!is_regular(target)) {
        return not_found();
    }
    return file(target);
}

} // namespace litepub

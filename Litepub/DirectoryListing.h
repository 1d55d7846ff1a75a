#pragma once

#include <filesystem>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

// URL encode helper; '/' is kept so whole paths can be encoded.
std::string url_encode(const std::string& value);

std::string html_escape(const std::string& s);

// HTML index of `dir`. `req_path` is the decoded request path without the
// leading slash ("" for the root). Dotfiles are hidden; documents get an
// extra link to their .epub alias.
std::string render_directory_listing(const fs::path& dir, const std::string& req_path);

} // namespace litepub

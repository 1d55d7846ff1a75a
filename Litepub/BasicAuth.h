#pragma once

#include <filesystem>
#include <string>

#include <httplib.h>

namespace litepub {

namespace fs = std::filesystem;

// Base64 encoding (for HTTP Basic Auth)
std::string base64_encode(const std::string& in);

// Credentials marker consulted for a directory.
fs::path auth_file_in(const fs::path& directory);

// `auth_file_contents` is the text of a .auth file ("user:password" on the
// first line). True if `authorization` is the matching Basic header.
bool credentials_match(const std::string& auth_file_contents, const std::string& authorization);

// HTTP Basic Auth check for everything in `directory`. Public when the
// directory has no .auth file; otherwise fills in a 401 and returns false
// unless the request carries the right credentials. Read on every call.
bool authenticate(const fs::path& directory, const httplib::Request& req, httplib::Response& res);

} // namespace litepub

#pragma once

#include <string>

namespace litepub {

// Media type for a file name, by extension (case-insensitive).
// Unknown extensions map to "application/octet-stream".
std::string get_mime_type(const std::string& path);

// If the content type is "text-like", append charset for correct rendering
std::string add_charset_if_text(const std::string& mime);

// .html / .htm: sources that go through the sanitizer.
bool is_html_source(const std::string& path);

// Anything that is turned into an EPUB: HTML sources and .xhtml / .xht.
bool is_document(const std::string& path);

} // namespace litepub

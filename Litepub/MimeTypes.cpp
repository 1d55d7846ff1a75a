#include "MimeTypes.h"

#include <algorithm>
#include <cctype>
#include <map>

namespace litepub {

std::string get_mime_type(const std::string& path) {
    auto slash = path.find_last_of('/');
    auto pos = path.rfind('.');
    if (pos == std::string::npos || (slash != std::string::npos && pos < slash)) {
        return "application/octet-stream";
    }
    auto ext = path.substr(pos);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    static const std::map<std::string, std::string> mime_map = {
        {".html", "text/html"}, {".htm", "text/html"}, {".css", "text/css"},
        {".xhtml", "application/xhtml+xml"}, {".xht", "application/xhtml+xml"},
        {".js", "application/javascript"}, {".mjs", "application/javascript"},
        {".json", "application/json"}, {".xml", "application/xml"},
        {".txt", "text/plain"}, {".csv", "text/csv"},
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"},
        {".png", "image/png"}, {".gif", "image/gif"},
        {".webp", "image/webp"}, {".avif", "image/avif"}, {".bmp", "image/bmp"},
        {".tif", "image/tiff"}, {".tiff", "image/tiff"},
        {".svg", "image/svg+xml"}, {".ico", "image/x-icon"},
        {".woff", "font/woff"}, {".woff2", "font/woff2"}, {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".mp4", "video/mp4"}, {".webm", "video/webm"},
        {".mp3", "audio/mpeg"}, {".ogg", "audio/ogg"}, {".wav", "audio/wav"},
        {".pdf", "application/pdf"}, {".zip", "application/zip"},
        {".epub", "application/epub+zip"}
    };
    auto it = mime_map.find(ext);
    if (it != mime_map.end()) return it->second;
    return "application/octet-stream";
}

std::string add_charset_if_text(const std::string& mime) {
    if (mime.rfind("text/", 0) == 0 ||
        mime == "application/javascript" ||
        mime == "application/json" ||
        mime == "application/xml" ||
        mime == "application/xhtml+xml") {
        return mime + "; charset=utf-8";
    }
    return mime;
}

bool is_html_source(const std::string& path) {
    return get_mime_type(path) == "text/html";
}

bool is_document(const std::string& path) {
    const auto mime = get_mime_type(path);
    return mime == "text/html" || mime == "application/xhtml+xml";
}

} // namespace litepub

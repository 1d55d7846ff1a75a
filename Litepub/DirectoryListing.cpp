#include "DirectoryListing.h"
#include "MimeTypes.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace litepub {

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            escaped << c;
        }
        else {
            escaped << '%' << std::setw(2) << int(c);
        }
    }
    return escaped.str();
}

std::string html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&#39;"; break;
        default: out += c;
        }
    }
    return out;
}

std::string render_directory_listing(const fs::path& dir, const std::string& req_path) {
    std::string base = req_path;
    while (!base.empty() && base.back() == '/') base.pop_back();

    std::vector<std::string> directories, files;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().u8string();
        if (name.empty() || name[0] == '.') continue;
        std::error_code type_ec;
        if (it->is_directory(type_ec)) directories.push_back(name);
        else if (it->is_regular_file(type_ec)) files.push_back(name);
    }
    std::sort(directories.begin(), directories.end());
    std::sort(files.begin(), files.end());

    auto href_for = [&](const std::string& name) {
        return "/" + url_encode(base.empty() ? name : base + "/" + name);
    };

    const std::string title = "Directory listing for /" + html_escape(base);
    std::stringstream html;
    html << "<!DOCTYPE html>\n"
        << "<html lang='en'>\n"
        << "<head>\n"
        << "  <meta charset='UTF-8'>\n"
        << "  <meta name='viewport' content='width=device-width, initial-scale=1.0'>\n"
        << "  <title>" << title << "</title>\n"
        << "  <style>\n"
        << "    body { font-family: system-ui, -apple-system, sans-serif; margin: 2em; }\n"
        << "    ul { list-style: none; padding: 0; }\n"
        << "    ul li { margin: .5em 0; }\n"
        << "    ul li a { text-decoration: none; color: #0366d6; }\n"
        << "    ul li a:hover { text-decoration: underline; }\n"
        << "  </style>\n"
        << "</head>\n"
        << "<body>\n"
        << "  <h1>" << title << "</h1>\n"
        << "  <ul>\n";

    if (!base.empty()) {
        auto slash = base.rfind('/');
        std::string parent = (slash == std::string::npos) ? "" : base.substr(0, slash);
        html << "    <li><a href='/" << url_encode(parent) << "'>..</a></li>\n";
    }

    for (const auto& name : directories) {
        html << "    <li><a href='" << href_for(name) << "'>" << html_escape(name) << "/</a></li>\n";
    }
    for (const auto& name : files) {
        html << "    <li><a href='" << href_for(name) << "'>" << html_escape(name) << "</a>";
        if (is_document(name)) {
            std::string stem = fs::u8path(name).stem().u8string();
            html << " (<a href='" << href_for(stem + ".epub") << "'>epub</a>)";
        }
        html << "</li>\n";
    }

    html << "  </ul>\n"
        << "</body>\n"
        << "</html>";
    return html.str();
}

} // namespace litepub

#include "RequestDispatcher.h"
#include "BasicAuth.h"
#include "DirectoryListing.h"
#include "FileUtil.h"
#include "Log.h"
#include "MimeTypes.h"
#include "PathResolver.h"

#include <exception>
#include <typeinfo>

namespace litepub {

namespace {

// Filename for Content-Disposition, without characters that would end the
// quoted string or the header line.
std::string download_name(const fs::path& path) {
    std::string name = path.stem().u8string() + ".epub";
    std::string out;
    for (char c : name) {
        if (c == '"' || c == '\\' || c == '\r' || c == '\n') continue;
        out += c;
    }
    return out;
}

void not_found(httplib::Response& res) {
    res.status = 404;
    res.set_content("Not Found", "text/plain");
}

} // namespace

RequestDispatcher::RequestDispatcher(const ServerConfig& config)
    : config_(config), packager_(config.content_root) {}

void RequestDispatcher::reject_method(const httplib::Request&, httplib::Response& res) {
    res.status = 405;
    res.set_header("Allow", "GET");
    res.set_content("Method Not Allowed", "text/plain");
}

void RequestDispatcher::handle(const httplib::Request& req, httplib::Response& res) const {
    if (req.method != "GET" && req.method != "HEAD") {
        reject_method(req, res);
        return;
    }

    std::string req_path = req.path;
    req_path.erase(0, req_path.find_first_not_of('/'));

    ResolvedTarget target = resolve_request_path(config_.content_root, req_path);
    switch (target.kind) {
    case ResolvedTarget::Kind::NotFound:
        not_found(res);
        return;
    case ResolvedTarget::Kind::Directory:
        serve_directory(target.path, req_path, req, res);
        return;
    case ResolvedTarget::Kind::File:
        serve_file(target.path, req, res);
        return;
    }
}

void RequestDispatcher::serve_directory(const fs::path& dir, const std::string& req_path,
                                        const httplib::Request& req, httplib::Response& res) const {
    if (!config_.directory_listing) {
        not_found(res);
        return;
    }
    if (!authenticate(dir, req, res)) return;
    res.status = 200;
    res.set_content(render_directory_listing(dir, req_path), "text/html; charset=utf-8");
}

void RequestDispatcher::serve_file(const fs::path& path, const httplib::Request& req,
                                   httplib::Response& res) const {
    if (!authenticate(path.parent_path(), req, res)) return;

    const std::string name = path.filename().string();
    if (is_document(name)) {
        serve_epub(path, res);
        return;
    }

    std::string body;
    try {
        body = read_file(path);
    } catch (const std::exception& e) {
        log_error(std::string("Reading ") + path.string() + " failed: " + e.what());
        res.status = 500;
        res.set_content(std::string("Internal Server Error: ") + e.what(), "text/plain");
        return;
    }
    res.status = 200;
    res.set_content(body, add_charset_if_text(get_mime_type(name)));
}

void RequestDispatcher::serve_epub(const fs::path& path, httplib::Response& res) const {
    try {
        fs::path xhtml = path;
        if (is_html_source(path.filename().string())) {
            xhtml = sanitizer_.sanitize(path);
        }
        std::string epub = packager_.package(xhtml);

        res.status = 200;
        res.set_header("Content-Disposition",
            "attachment; filename=\"" + download_name(path) + "\"");
        res.set_content(epub, EPUB_MIMETYPE);
    } catch (const std::exception& e) {
        log_error("Converting " + path.string() + " failed (" + typeid(e).name() + "): " + e.what());
        res.status = 500;
        res.set_content(std::string("Internal Server Error: ") + e.what(), "text/plain");
    }
}

} // namespace litepub

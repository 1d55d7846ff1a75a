#pragma once

#include "EpubPackager.h"
#include "HtmlSanitizer.h"
#include "ServerConfig.h"

#include <httplib.h>

namespace litepub {

// Answers GET /{path}: resolve inside the content root, check .auth, then
// sanitize (HTML sources) and package the document as an EPUB. Directories
// without an index page get a listing; other files are sent as they are.
// Safe to call from several server threads at once.
class RequestDispatcher {
public:
    // `config.content_root` must already be canonical (prepare_content_root).
    explicit RequestDispatcher(const ServerConfig& config);

    void handle(const httplib::Request& req, httplib::Response& res) const;

    // 405 for anything but GET/HEAD.
    static void reject_method(const httplib::Request& req, httplib::Response& res);

private:
    void serve_directory(const fs::path& dir, const std::string& req_path, const httplib::Request& req,
                         httplib::Response& res) const;
    void serve_file(const fs::path& path, const httplib::Request& req, httplib::Response& res) const;
    void serve_epub(const fs::path& path, httplib::Response& res) const;

    const ServerConfig config_;
    HtmlSanitizer sanitizer_;
    EpubPackager packager_;
};

} // namespace litepub

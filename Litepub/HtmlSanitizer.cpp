#include "HtmlSanitizer.h"
#include "ConversionError.h"
#include "FileUtil.h"
#include "Log.h"
#include "XmlUtil.h"

#include <functional>
#include <system_error>
#include <utility>
#include <vector>

#include <libxml/xmlstring.h>

namespace litepub {

namespace {

const char XHTML_TEMPLATE[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE html>
<html xmlns="http://www.w3.org/1999/xhtml">
<head>
    <meta charset="UTF-8"/>
    <title></title>
    <style>
        body { font-family: serif; line-height: 1.6; margin: 2em; }
        img  { max-width: 100%; height: auto; display: block; margin: 1em auto; }
        h1,h2,h3 { margin-top: 1.5em; }
        p   { margin: 1em 0; }
    </style>
</head>
<body></body>
</html>)";

const char* const NOISE_TAGS[] = {"script", "style", "nav", "footer", "iframe"};

const char* const CONTENT_CLASS_HINTS[] = {"content", "main", "article"};

bool class_looks_like_content(xmlNode* node) {
    if (!has_attribute(node, "class")) return false;
    const std::string cls = to_lower(get_attribute(node, "class"));
    for (const char* hint : CONTENT_CLASS_HINTS) {
        if (cls.find(hint) != std::string::npos) return true;
    }
    return false;
}

using Selector = std::pair<const char*, std::function<bool(xmlNode*)>>;

// Tried in order; later entries are fallbacks, not competitors.
const std::vector<Selector>& content_selectors() {
    static const std::vector<Selector> selectors = {
        {"main", [](xmlNode* n) { return is_element(n, "main"); }},
        {"article", [](xmlNode* n) { return is_element(n, "article"); }},
        {"class", class_looks_like_content},
        {"body", [](xmlNode* n) { return is_element(n, "body"); }},
    };
    return selectors;
}

xmlNode* select_content(xmlNode* root) {
    // Never pick <html> itself or anything in <head>
    xmlNode* body = find_first(root, [](xmlNode* n) { return is_element(n, "body"); });
    for (const auto& selector : content_selectors()) {
        xmlNode* scope = (body && std::string(selector.first) != "body") ? body : root;
        xmlNode* found = find_first(scope, [&](xmlNode* n) {
            return n != root && selector.second(n);
        });
        if (found) return found;
    }
    return nullptr;
}

void append_copy(xmlDoc* doc, xmlNode* parent, xmlNode* node) {
    xmlNode* copy = xmlDocCopyNode(node, doc, 1);
    if (!copy) {
        throw ConversionError("Out of memory copying content");
    }
    if (!xmlAddChild(parent, copy)) {
        xmlFreeNode(copy);
        throw ConversionError("Could not attach content");
    }
}

} // namespace

CacheDecision decide_cache(const CacheStamp& source, const CacheStamp& derived) {
    if (!source.exists) return CacheDecision::SourceMissing;
    if (derived.exists && derived.mtime >= source.mtime) return CacheDecision::UseCached;
    return CacheDecision::Regenerate;
}

CacheStamp stat_stamp(const fs::path& path) {
    CacheStamp stamp;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return stamp;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return stamp;
    stamp.exists = true;
    stamp.mtime = mtime;
    return stamp;
}

fs::path sanitized_path_for(const fs::path& html_path) {
    fs::path out = html_path;
    out.replace_extension(".xhtml");
    return out;
}

std::string sanitize_html(const std::string& html, const std::string& url) {
    if (!xmlCheckUTF8(reinterpret_cast<const unsigned char*>(html.c_str()))) {
        throw ConversionError("Document is not valid UTF-8: " + url);
    }

    // Empty or comment-only input has no root element; it yields the bare template
    XmlDocPtr soup = html.empty() ? XmlDocPtr() : parse_html(html, url);
    xmlNode* root = soup ? xmlDocGetRootElement(soup.get()) : nullptr;

    xmlNode* content = nullptr;
    xmlNode* title = nullptr;
    if (root) {
        remove_elements(root, NOISE_TAGS, sizeof(NOISE_TAGS) / sizeof(NOISE_TAGS[0]));
        content = select_content(root);
        title = find_first(root, [](xmlNode* n) { return is_element(n, "title"); });
    }

    XmlDocPtr clean = parse_xml(std::string(XHTML_TEMPLATE), url);
    if (!clean) {
        throw ConversionError("Could not build XHTML template");
    }
    xmlNode* clean_root = xmlDocGetRootElement(clean.get());
    xmlNode* clean_title = find_first(clean_root, [](xmlNode* n) { return is_element(n, "title"); });
    xmlNode* clean_body = find_first(clean_root, [](xmlNode* n) { return is_element(n, "body"); });

    if (title) {
        // Text node, so markup characters in the title are escaped on output
        xmlAddChild(clean_title, xmlNewDocText(clean.get(),
            reinterpret_cast<const xmlChar*>(text_content(title).c_str())));
    }

    if (content) {
        if (is_element(content, "body")) {
            // <body> inside <body> is not valid XHTML; take its children
            for (xmlNode* child = content->children; child; child = child->next) {
                append_copy(clean.get(), clean_body, child);
            }
        } else {
            append_copy(clean.get(), clean_body, content);
        }
    }

    std::string out = serialize_xml(clean.get());
    if (out.empty()) {
        throw ConversionError("Could not serialize XHTML for " + url);
    }
    return out;
}

fs::path HtmlSanitizer::sanitize(const fs::path& html_path) const {
    const fs::path xhtml_path = sanitized_path_for(html_path);

    std::size_t stripe = std::hash<std::string>{}(xhtml_path.string()) % LOCK_STRIPES;
    std::lock_guard<std::mutex> lock(locks_[stripe]);

    switch (decide_cache(stat_stamp(html_path), stat_stamp(xhtml_path))) {
    case CacheDecision::SourceMissing:
        throw ConversionError("Source document not found: " + html_path.string());
    case CacheDecision::UseCached:
        log_debug("Sanitized copy is current: " + xhtml_path.string());
        return xhtml_path;
    case CacheDecision::Regenerate:
        break;
    }

    std::string xhtml = sanitize_html(read_file(html_path), html_path.string());
    write_file_atomic(xhtml_path, xhtml);
    log_info("Sanitized " + html_path.string() + " -> " + xhtml_path.filename().string());
    return xhtml_path;
}

} // namespace litepub

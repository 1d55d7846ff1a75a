#pragma once

#include <functional>
#include <memory>
#include <string>

#include <libxml/tree.h>

namespace litepub {

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

// Lenient tag-soup parse (libxml2 HTML parser, recover mode, no network).
// Returns null only if libxml2 could not build a tree at all.
XmlDocPtr parse_html(const std::string& bytes, const std::string& url);

// Strict XML parse; returns null if the input is not well formed.
XmlDocPtr parse_xml(const std::string& bytes, const std::string& url);

// UTF-8 XML serialization with declaration. HTML-parsed trees are written
// as XML too.
std::string serialize_xml(xmlDoc* doc);

bool is_element(const xmlNode* node, const char* name);

// Attribute value without namespace, or empty if absent.
std::string get_attribute(xmlNode* node, const char* name);
bool has_attribute(xmlNode* node, const char* name);

// Concatenated text content of a node and its descendants.
std::string text_content(xmlNode* node);

// First element in document order below `root` (inclusive) matching `pred`.
xmlNode* find_first(xmlNode* root, const std::function<bool(xmlNode*)>& pred);

// Calls `fn` for every element below `root` (inclusive) in document order.
void for_each_element(xmlNode* root, const std::function<void(xmlNode*)>& fn);

// Unlinks and frees every element named in `names` (with its subtree).
// Returns how many were removed.
int remove_elements(xmlNode* root, const char* const* names, std::size_t count);

} // namespace litepub

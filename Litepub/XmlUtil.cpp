#include "XmlUtil.h"

#include <vector>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/xmlsave.h>

namespace litepub {

namespace {

struct XmlBufferDeleter {
    void operator()(xmlBuffer* buf) const { xmlBufferFree(buf); }
};

const xmlChar* to_xml(const char* s) {
    return reinterpret_cast<const xmlChar*>(s);
}

} // namespace

XmlDocPtr parse_html(const std::string& bytes, const std::string& url) {
    const int options = HTML_PARSE_RECOVER | HTML_PARSE_NONET | HTML_PARSE_NOERROR |
                        HTML_PARSE_NOWARNING;
    return XmlDocPtr(htmlReadMemory(bytes.data(), static_cast<int>(bytes.size()),
                                    url.c_str(), "UTF-8", options));
}

XmlDocPtr parse_xml(const std::string& bytes, const std::string& url) {
    const int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    return XmlDocPtr(xmlReadMemory(bytes.data(), static_cast<int>(bytes.size()),
                                   url.c_str(), "UTF-8", options));
}

std::string serialize_xml(xmlDoc* doc) {
    std::unique_ptr<xmlBuffer, XmlBufferDeleter> buf(xmlBufferCreate());
    if (!buf) return {};
    xmlSaveCtxtPtr ctxt = xmlSaveToBuffer(buf.get(), "UTF-8", XML_SAVE_AS_XML);
    if (!ctxt) return {};
    xmlSaveDoc(ctxt, doc);
    xmlSaveClose(ctxt);
    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buf.get())),
                       static_cast<std::size_t>(xmlBufferLength(buf.get())));
}

bool is_element(const xmlNode* node, const char* name) {
    return node && node->type == XML_ELEMENT_NODE &&
           xmlStrcasecmp(node->name, to_xml(name)) == 0;
}

std::string get_attribute(xmlNode* node, const char* name) {
    xmlChar* xp = xmlGetNoNsProp(node, to_xml(name));
    if (!xp) return {};
    std::string value(reinterpret_cast<const char*>(xp));
    xmlFree(xp);
    return value;
}

bool has_attribute(xmlNode* node, const char* name) {
    return xmlHasNsProp(node, to_xml(name), nullptr) != nullptr;
}

std::string text_content(xmlNode* node) {
    xmlChar* xp = xmlNodeGetContent(node);
    if (!xp) return {};
    std::string value(reinterpret_cast<const char*>(xp));
    xmlFree(xp);
    return value;
}

xmlNode* find_first(xmlNode* root, const std::function<bool(xmlNode*)>& pred) {
    if (!root || root->type != XML_ELEMENT_NODE) return nullptr;
    if (pred(root)) return root;
    for (xmlNode* child = root->children; child; child = child->next) {
        if (xmlNode* found = find_first(child, pred)) return found;
    }
    return nullptr;
}

void for_each_element(xmlNode* root, const std::function<void(xmlNode*)>& fn) {
    if (!root || root->type != XML_ELEMENT_NODE) return;
    fn(root);
    for (xmlNode* child = root->children; child; child = child->next) {
        for_each_element(child, fn);
    }
}

int remove_elements(xmlNode* root, const char* const* names, std::size_t count) {
    if (!root) return 0;
    // Collect first: a matched subtree is freed whole, so never descend into it
    std::vector<xmlNode*> doomed;
    std::function<void(xmlNode*)> collect = [&](xmlNode* parent) {
        for (xmlNode* node = parent->children; node; node = node->next) {
            if (node->type != XML_ELEMENT_NODE) continue;
            bool match = false;
            for (std::size_t i = 0; i < count && !match; ++i) {
                match = is_element(node, names[i]);
            }
            if (match) {
                doomed.push_back(node);
            } else {
                collect(node);
            }
        }
    };
    collect(root);

    for (xmlNode* node : doomed) {
        xmlUnlinkNode(node);
        xmlFreeNode(node);
    }
    return static_cast<int>(doomed.size());
}

} // namespace litepub

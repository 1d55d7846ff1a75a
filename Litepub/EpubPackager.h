#pragma once

#include "AssetEmbedder.h"

#include <filesystem>
#include <string>

namespace litepub {

namespace fs = std::filesystem;

extern const char EPUB_MIMETYPE[];

// content.opf for one content document plus the embedded assets.
// The identifier is "urn:uuid:<title>".
std::string make_content_opf(const std::string& title, const AssetManifest& assets);

// Assembles the OCF container: mimetype (stored, first), container.xml,
// OEBPS/content.xhtml, content.opf, then one OEBPS/ entry per asset.
std::string build_epub(const std::string& title, const std::string& content_xhtml,
                       const AssetManifest& assets);

class EpubPackager {
public:
    explicit EpubPackager(fs::path content_root);

    // EPUB bytes for an XHTML document inside the content root, with its
    // local images embedded. Throws ConversionError.
    std::string package(const fs::path& xhtml_path) const;

private:
    fs::path content_root_;
};

} // namespace litepub

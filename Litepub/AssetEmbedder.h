#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <libxml/tree.h>

namespace litepub {

namespace fs = std::filesystem;

// One local file copied into the archive.
struct EmbeddedAsset {
    std::string reference;  // src value as written in the document
    std::string media_type;
    std::string entry_name; // normalized "OEBPS/<reference>", also the OPF href
    std::string data;
};

// Ordered by first reference in the document.
using AssetManifest = std::vector<EmbeddedAsset>;

// True for src values that are never embedded (inline data, remote URLs).
bool is_external_reference(const std::string& src);

// Collects every local file referenced through a src attribute, resolved
// against `base_dir`. References that are missing, unreadable, outside
// `content_root`, or that would climb above the archive root once placed
// beside OEBPS/content.xhtml are skipped; the document is never modified.
AssetManifest embed_assets(xmlDoc* doc, const fs::path& base_dir, const fs::path& content_root);

} // namespace litepub

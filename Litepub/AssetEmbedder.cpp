#include "AssetEmbedder.h"
#include "ConversionError.h"
#include "FileUtil.h"
#include "Log.h"
#include "MimeTypes.h"
#include "PathResolver.h"
#include "XmlUtil.h"

#include <algorithm>
#include <iterator>
#include <set>
#include <system_error>

namespace litepub {

namespace {

// Archive entry for a reference made from OEBPS/content.xhtml:
// "img/a.png" -> "OEBPS/img/a.png", "../img/a.png" -> "img/a.png".
// Empty if the reference is absolute or climbs above the archive root.
std::string archive_entry_for(const std::string& src) {
    fs::path ref = fs::u8path(src);
    if (ref.is_absolute() || ref.has_root_name() || ref.has_root_directory()) return {};
    fs::path entry = (fs::path("OEBPS") / ref).lexically_normal();
    if (entry.empty() || entry == "." || entry.filename().empty()) return {};
    if (entry.begin()->string() == "..") return {};
    return entry.generic_u8string();
}

// Members the packager writes itself
const char* const RESERVED_ENTRIES[] = {
    "mimetype", "META-INF/container.xml", "OEBPS/content.xhtml", "content.opf",
};

} // namespace

bool is_external_reference(const std::string& src) {
    return starts_with_icase(src, "data:") ||
           starts_with_icase(src, "http://") ||
           starts_with_icase(src, "https://");
}

AssetManifest embed_assets(xmlDoc* doc, const fs::path& base_dir, const fs::path& content_root) {
    AssetManifest manifest;
    std::set<std::string> added(std::begin(RESERVED_ENTRIES), std::end(RESERVED_ENTRIES));

    xmlNode* root = doc ? xmlDocGetRootElement(doc) : nullptr;
    for_each_element(root, [&](xmlNode* el) {
        if (!has_attribute(el, "src")) return;
        const std::string src = get_attribute(el, "src");
        if (src.empty() || is_external_reference(src)) return;

        const std::string entry_name = archive_entry_for(src);
        if (entry_name.empty()) {
            log_debug("Skipping asset with no place in the archive: " + src);
            return;
        }
        if (added.count(entry_name)) return;

        std::error_code ec;
        fs::path asset_path = fs::weakly_canonical(base_dir / fs::u8path(src), ec);
        if (ec || !fs::is_regular_file(asset_path, ec) || !is_within_root(content_root, asset_path)) {
            log_debug("Skipping missing or out-of-root asset: " + src);
            return;
        }

        EmbeddedAsset asset;
        try {
            asset.data = read_file(asset_path);
        } catch (const ConversionError& e) {
            log_warn(std::string("Skipping unreadable asset: ") + e.what());
            return;
        }
        asset.reference = src;
        asset.media_type = get_mime_type(asset_path.filename().string());
        asset.entry_name = entry_name;
        added.insert(entry_name);
        manifest.push_back(std::move(asset));
    });

    return manifest;
}

} // namespace litepub

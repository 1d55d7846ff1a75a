#include "EpubPackager.h"
#include "ConversionError.h"
#include "FileUtil.h"
#include "Log.h"
#include "XmlUtil.h"
#include "ZipArchive.h"

#include <sstream>
#include <utility>

namespace litepub {

const char EPUB_MIMETYPE[] = "application/epub+zip";

namespace {

const char CONTAINER_XML[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<container version="1.0"
           xmlns="urn:oasis:names:tc:opendocument:xmlns:container">
  <rootfiles>
    <rootfile full-path="content.opf"
              media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>)";

std::string xml_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += c;
        }
    }
    return out;
}

} // namespace

std::string make_content_opf(const std::string& title, const AssetManifest& assets) {
    const std::string t = xml_escape(title);
    std::ostringstream opf;
    opf << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        << "<package version=\"3.0\" xmlns=\"http://www.idpf.org/2007/opf\" unique-identifier=\"bookid\">\n"
        << "  <metadata xmlns:dc=\"http://purl.org/dc/elements/1.1/\">\n"
        << "    <dc:title>" << t << "</dc:title>\n"
        << "    <dc:language>en</dc:language>\n"
        << "    <dc:identifier id=\"bookid\">urn:uuid:" << t << "</dc:identifier>\n"
        << "  </metadata>\n"
        << "  <manifest>\n"
        << "    <item id=\"content\" href=\"OEBPS/content.xhtml\"\n"
        << "          media-type=\"application/xhtml+xml\"/>";
    for (std::size_t i = 0; i < assets.size(); ++i) {
        opf << "\n    <item id=\"asset_" << i << "\" href=\"" << xml_escape(assets[i].entry_name)
            << "\" media-type=\"" << xml_escape(assets[i].media_type) << "\"/>";
    }
    opf << "\n  </manifest>\n"
        << "  <spine>\n"
        << "    <itemref idref=\"content\"/>\n"
        << "  </spine>\n"
        << "</package>";
    return opf.str();
}

std::string build_epub(const std::string& title, const std::string& content_xhtml,
                       const AssetManifest& assets) {
    ZipArchive zip;
    zip.add("mimetype", EPUB_MIMETYPE, ZipArchive::Method::Stored);
    zip.add("META-INF/container.xml", CONTAINER_XML);
    zip.add("OEBPS/content.xhtml", content_xhtml);
    zip.add("content.opf", make_content_opf(title, assets));
    for (const auto& asset : assets) {
        zip.add(asset.entry_name, asset.data);
    }
    return zip.finish();
}

EpubPackager::EpubPackager(fs::path content_root) : content_root_(std::move(content_root)) {}

std::string EpubPackager::package(const fs::path& xhtml_path) const {
    const std::string bytes = read_file(xhtml_path);

    // Hand-written .xhtml is not always well formed; fall back to tag soup
    XmlDocPtr doc = parse_xml(bytes, xhtml_path.string());
    if (!doc) {
        log_debug("Not well-formed XML, parsing as HTML: " + xhtml_path.string());
        doc = parse_html(bytes, xhtml_path.string());
    }
    if (!doc || !xmlDocGetRootElement(doc.get())) {
        throw ConversionError("Could not parse " + xhtml_path.string());
    }

    AssetManifest assets = embed_assets(doc.get(), xhtml_path.parent_path(), content_root_);

    std::string content = serialize_xml(doc.get());
    if (content.empty()) {
        throw ConversionError("Could not serialize " + xhtml_path.string());
    }

    const std::string title = xhtml_path.stem().u8string();
    log_debug("Packaging " + xhtml_path.string() + " with " + std::to_string(assets.size()) + " asset(s)");
    return build_epub(title, content, assets);
}

} // namespace litepub

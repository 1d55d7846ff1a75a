// EPUB packaging: container layout, OPF manifest and image embedding

#include <unity.h>

#include "AssetEmbedder.h"
#include "ConversionError.h"
#include "EpubPackager.h"
#include "XmlUtil.h"
#include "test_support.h"

using namespace litepub;
using test_support::TempTree;
using test_support::ZipEntry;
using test_support::contains;
using test_support::readLE16;
using test_support::find_entry;
using test_support::read_zip;

static TempTree* tree = nullptr;
static fs::path root;

void setUp() {
    tree = new TempTree();
    root = tree->mkdir("content");
    root = fs::canonical(root);
}

void tearDown() {
    tree->cleanup();
    delete tree;
    tree = nullptr;
}

static std::string page(const std::string& body) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<html xmlns=\"http://www.w3.org/1999/xhtml\"><head><title>t</title></head>"
           "<body>" + body + "</body></html>";
}

// ============================================================================
// Container layout
// ============================================================================

void test_mimetype_is_first_and_stored() {
    std::string epub = build_epub("Book", page("<p>x</p>"), {});
    auto entries = read_zip(epub);
    TEST_ASSERT_TRUE(entries.size() >= 1);
    TEST_ASSERT_EQUAL_STRING("mimetype", entries[0].name.c_str());
    TEST_ASSERT_EQUAL(0, entries[0].method);
    TEST_ASSERT_EQUAL(0, entries[0].local_extra_fields);
    TEST_ASSERT_EQUAL(0, readLE16(epub, 28));
    TEST_ASSERT_EQUAL_STRING("application/epub+zip", entries[0].data.c_str());
    // Readers sniff the fixed prefix
    TEST_ASSERT_EQUAL_STRING("mimetypeapplication/epub+zip", epub.substr(30, 28).c_str());
}

void test_entry_order() {
    AssetManifest assets;
    assets.push_back({"a.png", "image/png", "OEBPS/a.png", "PNG"});
    std::string epub = build_epub("Book", page("<p>x</p>"), assets);

    auto entries = read_zip(epub);
    TEST_ASSERT_EQUAL(5, entries.size());
    TEST_ASSERT_EQUAL_STRING("mimetype", entries[0].name.c_str());
    TEST_ASSERT_EQUAL_STRING("META-INF/container.xml", entries[1].name.c_str());
    TEST_ASSERT_EQUAL_STRING("OEBPS/content.xhtml", entries[2].name.c_str());
    TEST_ASSERT_EQUAL_STRING("content.opf", entries[3].name.c_str());
    TEST_ASSERT_EQUAL_STRING("OEBPS/a.png", entries[4].name.c_str());
}

void test_container_points_at_opf() {
    auto entries = read_zip(build_epub("Book", page(""), {}));
    const ZipEntry* container = find_entry(entries, "META-INF/container.xml");
    TEST_ASSERT_NOT_NULL(container);
    TEST_ASSERT_TRUE(contains(container->data, "full-path=\"content.opf\""));
    TEST_ASSERT_TRUE(contains(container->data, "application/oebps-package+xml"));
}

// ============================================================================
// OPF
// ============================================================================

void test_opf_metadata() {
    std::string opf = make_content_opf("my-article", {});
    TEST_ASSERT_TRUE(contains(opf, "<dc:title>my-article</dc:title>"));
    TEST_ASSERT_TRUE(contains(opf, "<dc:language>en</dc:language>"));
    TEST_ASSERT_TRUE(contains(opf, ">urn:uuid:my-article</dc:identifier>"));
    TEST_ASSERT_TRUE(contains(opf, "unique-identifier=\"bookid\""));
    TEST_ASSERT_TRUE(contains(opf, "<itemref idref=\"content\"/>"));
    TEST_ASSERT_NOT_NULL(parse_xml(opf, "content.opf").get());
}

void test_opf_title_is_escaped() {
    std::string opf = make_content_opf("R&D <notes>", {});
    TEST_ASSERT_TRUE(contains(opf, "<dc:title>R&amp;D &lt;notes&gt;</dc:title>"));
    TEST_ASSERT_NOT_NULL(parse_xml(opf, "content.opf").get());
}

void test_opf_asset_ids_follow_manifest_order() {
    AssetManifest assets;
    assets.push_back({"b.jpg", "image/jpeg", "OEBPS/b.jpg", "J"});
    assets.push_back({"img/a.png", "image/png", "OEBPS/img/a.png", "P"});
    std::string opf = make_content_opf("t", assets);

    auto first = opf.find("id=\"asset_0\" href=\"OEBPS/b.jpg\" media-type=\"image/jpeg\"");
    auto second = opf.find("id=\"asset_1\" href=\"OEBPS/img/a.png\" media-type=\"image/png\"");
    TEST_ASSERT_TRUE(first != std::string::npos);
    TEST_ASSERT_TRUE(second != std::string::npos);
    TEST_ASSERT_TRUE(first < second);
    TEST_ASSERT_FALSE(contains(opf, "asset_2"));
}

// ============================================================================
// Asset embedding
// ============================================================================

void test_embed_skips_external_references() {
    TEST_ASSERT_TRUE(is_external_reference("data:image/png;base64,AAAA"));
    TEST_ASSERT_TRUE(is_external_reference("HTTPS://example.com/a.png"));
    TEST_ASSERT_TRUE(is_external_reference("http://example.com/a.png"));
    TEST_ASSERT_FALSE(is_external_reference("img/a.png"));
    TEST_ASSERT_FALSE(is_external_reference("httpfoo.png"));
}

void test_embed_collects_local_images() {
    std::string png("\x89PNG\r\n\x1a\n\0\0binary", 16);
    tree->write("content/img/photo.png", png);
    tree->write("content/cover.jpg", "JPEG");
    XmlDocPtr doc = parse_xml(page(
        "<img src=\"img/photo.png\"/>"
        "<img src=\"data:image/png;base64,AAAA\"/>"
        "<img src=\"https://example.com/x.png\"/>"
        "<img src=\"\"/>"
        "<img src=\"cover.jpg\"/>"
        "<img src=\"./img/photo.png\"/>"), "page.xhtml");
    TEST_ASSERT_NOT_NULL(doc.get());

    AssetManifest assets = embed_assets(doc.get(), root, root);
    TEST_ASSERT_EQUAL(2, assets.size());
    TEST_ASSERT_EQUAL_STRING("OEBPS/img/photo.png", assets[0].entry_name.c_str());
    TEST_ASSERT_EQUAL_STRING("image/png", assets[0].media_type.c_str());
    TEST_ASSERT_TRUE(assets[0].data == png);
    TEST_ASSERT_EQUAL_STRING("OEBPS/cover.jpg", assets[1].entry_name.c_str());
    TEST_ASSERT_EQUAL_STRING("image/jpeg", assets[1].media_type.c_str());
}

void test_embed_skips_missing_and_escaping() {
    tree->write("secret.png", "outside");
    XmlDocPtr doc = parse_xml(page(
        "<img src=\"nope.png\"/>"
        "<img src=\"../secret.png\"/>"
        "<img src=\"../../secret.png\"/>"
        "<img src=\"/etc/hostname\"/>"), "page.xhtml");

    // "../secret.png" exists but lies outside the content root;
    // "../../secret.png" would climb above the archive root
    AssetManifest assets = embed_assets(doc.get(), root, root);
    TEST_ASSERT_EQUAL(0, assets.size());
}

void test_embed_places_parent_references_beside_oebps() {
    tree->write("content/img/a.png", "A");
    tree->write("content/ok.gif", "GIF");
    tree->mkdir("content/articles");
    XmlDocPtr doc = parse_xml(page(
        "<img src=\"../img/a.png\"/>"
        "<img src=\"../ok.gif\"/>"
        "<img src=\"../articles/../img/a.png\"/>"), "post.xhtml");

    AssetManifest assets = embed_assets(doc.get(), root / "articles", root);
    TEST_ASSERT_EQUAL(2, assets.size());
    TEST_ASSERT_EQUAL_STRING("img/a.png", assets[0].entry_name.c_str());
    TEST_ASSERT_EQUAL_STRING("../img/a.png", assets[0].reference.c_str());
    TEST_ASSERT_EQUAL_STRING("ok.gif", assets[1].entry_name.c_str());
}

void test_embed_never_shadows_container_files() {
    tree->write("content/mimetype", "not an image");
    XmlDocPtr doc = parse_xml(page(
        "<img src=\"../content.opf\"/>"
        "<img src=\"../mimetype\"/>"
        "<img src=\"content.xhtml\"/>"), "page.xhtml");
    tree->write("content/sub/content.xhtml", "x");
    tree->write("content/content.opf", "x");

    AssetManifest assets = embed_assets(doc.get(), root / "sub", root);
    TEST_ASSERT_EQUAL(0, assets.size());
}

void test_embed_never_rewrites_src() {
    tree->write("content/a.png", "A");
    XmlDocPtr doc = parse_xml(page("<img src=\"a.png\"/>"), "page.xhtml");
    embed_assets(doc.get(), root, root);
    TEST_ASSERT_TRUE(contains(serialize_xml(doc.get()), "src=\"a.png\""));
}

// ============================================================================
// End to end
// ============================================================================

void test_package_embeds_and_titles() {
    std::string png("PNGDATA\0\x01\x02", 10);
    tree->write("content/img/a.png", png);
    fs::path xhtml = tree->write("content/my-post.xhtml",
        page("<p>Hello</p><img src=\"img/a.png\"/><img src=\"missing.png\"/>"));

    EpubPackager packager(root);
    auto entries = read_zip(packager.package(xhtml));
    TEST_ASSERT_EQUAL(5, entries.size());

    const ZipEntry* content = find_entry(entries, "OEBPS/content.xhtml");
    TEST_ASSERT_NOT_NULL(content);
    TEST_ASSERT_TRUE(contains(content->data, "<p>Hello</p>"));
    TEST_ASSERT_TRUE(contains(content->data, "src=\"img/a.png\""));

    const ZipEntry* opf = find_entry(entries, "content.opf");
    TEST_ASSERT_NOT_NULL(opf);
    TEST_ASSERT_TRUE(contains(opf->data, "urn:uuid:my-post"));
    TEST_ASSERT_TRUE(contains(opf->data, "href=\"OEBPS/img/a.png\""));

    const ZipEntry* image = find_entry(entries, "OEBPS/img/a.png");
    TEST_ASSERT_NOT_NULL(image);
    TEST_ASSERT_TRUE(image->data == png);
}

void test_package_embeds_parent_directory_image() {
    tree->write("content/img/a.png", "PARENT-IMAGE");
    fs::path xhtml = tree->write("content/articles/post.xhtml",
        page("<p>Post</p><img src=\"../img/a.png\"/>"));

    EpubPackager packager(root);
    auto entries = read_zip(packager.package(xhtml));

    const ZipEntry* image = find_entry(entries, "img/a.png");
    TEST_ASSERT_NOT_NULL(image);
    TEST_ASSERT_EQUAL_STRING("PARENT-IMAGE", image->data.c_str());

    const ZipEntry* opf = find_entry(entries, "content.opf");
    TEST_ASSERT_NOT_NULL(opf);
    TEST_ASSERT_TRUE(contains(opf->data, "href=\"img/a.png\" media-type=\"image/png\""));

    // src still resolves from OEBPS/content.xhtml to the entry
    const ZipEntry* content = find_entry(entries, "OEBPS/content.xhtml");
    TEST_ASSERT_NOT_NULL(content);
    TEST_ASSERT_TRUE(contains(content->data, "src=\"../img/a.png\""));
}

void test_package_accepts_malformed_xhtml() {
    fs::path xhtml = tree->write("content/rough.xhtml", "<html><body><p>unclosed<br></body></html>");
    EpubPackager packager(root);
    auto entries = read_zip(packager.package(xhtml));
    const ZipEntry* content = find_entry(entries, "OEBPS/content.xhtml");
    TEST_ASSERT_NOT_NULL(content);
    TEST_ASSERT_TRUE(contains(content->data, "unclosed"));
}

void test_package_missing_file_throws() {
    EpubPackager packager(root);
    bool thrown = false;
    try {
        packager.package(root / "gone.xhtml");
    } catch (const ConversionError&) {
        thrown = true;
    }
    TEST_ASSERT_TRUE(thrown);
}

int main(int argc, char **argv) {
    UNITY_BEGIN();

    RUN_TEST(test_mimetype_is_first_and_stored);
    RUN_TEST(test_entry_order);
    RUN_TEST(test_container_points_at_opf);

    RUN_TEST(test_opf_metadata);
    RUN_TEST(test_opf_title_is_escaped);
    RUN_TEST(test_opf_asset_ids_follow_manifest_order);

    RUN_TEST(test_embed_skips_external_references);
    RUN_TEST(test_embed_collects_local_images);
    RUN_TEST(test_embed_skips_missing_and_escaping);
    RUN_TEST(test_embed_places_parent_references_beside_oebps);
    RUN_TEST(test_embed_never_shadows_container_files);
    RUN_TEST(test_embed_never_rewrites_src);

    RUN_TEST(test_package_embeds_and_titles);
    RUN_TEST(test_package_embeds_parent_directory_image);
    RUN_TEST(test_package_accepts_malformed_xhtml);
    RUN_TEST(test_package_missing_file_throws);

    return UNITY_END();
}

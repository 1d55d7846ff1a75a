#pragma once

#include <deque>
#include <memory>
#include <string>

#include <zip.h>

namespace litepub {

// In-memory zip archive built with libzip. Members are written in the order
// they are added.
class ZipArchive {
public:
    enum class Method { Stored, Deflated };

    // Throws ConversionError if libzip cannot set up the buffer.
    ZipArchive();

    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;

    // Throws ConversionError on an empty or duplicate name, a libzip failure,
    // or once the archive has been finished.
    void add(const std::string& name, const std::string& data, Method method = Method::Deflated);

    bool contains(const std::string& name) const;
    std::size_t entry_count() const;

    // Writes the central directory and returns the archive bytes. The
    // archive cannot be used afterwards.
    std::string finish();

private:
    struct ArchiveDeleter {
        void operator()(zip_t* za) const { zip_discard(za); }
    };
    struct SourceDeleter {
        void operator()(zip_source_t* src) const { zip_source_free(src); }
    };

    std::unique_ptr<zip_source_t, SourceDeleter> buffer_;
    std::unique_ptr<zip_t, ArchiveDeleter> archive_;
    // libzip reads member data only when the archive is closed
    std::deque<std::string> pending_;
};

} // namespace litepub

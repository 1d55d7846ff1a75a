#include "ZipArchive.h"
#include "ConversionError.h"

#include <cstdio>

namespace litepub {

namespace {

std::string error_text(zip_error_t* error) {
    std::string msg = zip_error_strerror(error);
    zip_error_fini(error);
    return msg;
}

} // namespace

ZipArchive::ZipArchive() {
    zip_error_t error;
    zip_error_init(&error);

    buffer_.reset(zip_source_buffer_create(nullptr, 0, 0, &error));
    if (!buffer_) {
        throw ConversionError("zip_source_buffer_create failed: " + error_text(&error));
    }

    archive_.reset(zip_open_from_source(buffer_.get(), ZIP_CREATE | ZIP_TRUNCATE, &error));
    if (!archive_) {
        throw ConversionError("zip_open_from_source failed: " + error_text(&error));
    }
    // The archive now owns one reference; keep ours for reading the bytes back
    zip_source_keep(buffer_.get());
    zip_error_fini(&error);
}

bool ZipArchive::contains(const std::string& name) const {
    return archive_ && zip_name_locate(archive_.get(), name.c_str(), ZIP_FL_ENC_UTF_8) >= 0;
}

std::size_t ZipArchive::entry_count() const {
    if (!archive_) return 0;
    zip_int64_t n = zip_get_num_entries(archive_.get(), 0);
    return n < 0 ? 0 : static_cast<std::size_t>(n);
}

void ZipArchive::add(const std::string& name, const std::string& data, Method method) {
    if (!archive_) {
        throw ConversionError("Zip archive already finished");
    }
    if (name.empty()) {
        throw ConversionError("Invalid zip member name");
    }
    if (contains(name)) {
        throw ConversionError("Duplicate zip member: " + name);
    }

    pending_.push_back(data);
    const std::string& stored = pending_.back();
    zip_source_t* src = zip_source_buffer(archive_.get(), stored.data(), stored.size(), 0);
    if (!src) {
        pending_.pop_back();
        throw ConversionError("zip_source_buffer failed for " + name + ": " + zip_strerror(archive_.get()));
    }

    zip_int64_t idx = zip_file_add(archive_.get(), name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
        zip_source_free(src);
        pending_.pop_back();
        throw ConversionError("zip_file_add failed for " + name + ": " + zip_strerror(archive_.get()));
    }

    const zip_int32_t comp = (method == Method::Stored) ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if (zip_set_file_compression(archive_.get(), static_cast<zip_uint64_t>(idx), comp, 0) != 0) {
        throw ConversionError("zip_set_file_compression failed for " + name + ": " +
                              zip_strerror(archive_.get()));
    }
}

std::string ZipArchive::finish() {
    if (!archive_) {
        throw ConversionError("Zip archive already finished");
    }
    if (zip_close(archive_.get()) != 0) {
        std::string msg = zip_strerror(archive_.get());
        archive_.reset();
        throw ConversionError("zip_close failed: " + msg);
    }
    archive_.release(); // closed and freed by zip_close
    pending_.clear();

    zip_source_t* src = buffer_.get();
    if (zip_source_open(src) < 0) {
        throw ConversionError(std::string("zip_source_open failed: ") +
                              zip_error_strerror(zip_source_error(src)));
    }
    std::string out;
    if (zip_source_seek(src, 0, SEEK_END) == 0) {
        zip_int64_t size = zip_source_tell(src);
        if (size > 0 && zip_source_seek(src, 0, SEEK_SET) == 0) {
            out.resize(static_cast<std::size_t>(size));
            zip_int64_t n = zip_source_read(src, &out[0], static_cast<zip_uint64_t>(size));
            if (n != size) {
                zip_source_close(src);
                throw ConversionError("zip_source_read incomplete");
            }
        }
    }
    zip_source_close(src);
    return out;
}

} // namespace litepub

#include "xlbook/archive/ZipReader.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace xlbook {
namespace archive {

ZipReader::ZipReader(std::string path)
    : filename_(std::move(path)) {
}

ZipReader::~ZipReader() {
    cleanup();
}

ZipError ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filename_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filename_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return result == MZ_OPEN_ERROR ? ZipError::FileNotFound : ZipError::BadFormat;
    }

    is_open_ = true;
    ARCHIVE_DEBUG("Zip archive opened for reading: {}", filename_);
    return ZipError::Ok;
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
}

std::vector<ZipReader::EntryInfo> ZipReader::listEntriesInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EntryInfo> entries;

    if (!is_open_ || !unzip_handle_) {
        return entries;
    }

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return entries;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK &&
            file_info && file_info->filename && file_info->filename[0] != '\0') {
            EntryInfo info;
            info.path = file_info->filename;
            info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
            info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
            info.is_directory = (info.path.back() == '/');
            entries.push_back(std::move(info));
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    return entries;
}

bool ZipReader::readCurrentEntry(uint64_t expected_size, std::string& out) const {
    if (expected_size > static_cast<uint64_t>(INT32_MAX)) {
        ARCHIVE_ERROR("Entry too large: {} bytes", expected_size);
        return false;
    }
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        return false;
    }

    out.assign(static_cast<size_t>(expected_size), '\0');
    int32_t read = expected_size > 0
                   ? mz_zip_reader_entry_read(unzip_handle_, out.data(), static_cast<int32_t>(expected_size))
                   : 0;
    mz_zip_reader_entry_close(unzip_handle_);
    return read == static_cast<int32_t>(expected_size);
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return ZipError::BadFormat;
    }

    std::string latest;
    bool found = false;

    do {
        mz_zip_file* info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
            break;
        }
        if (info->filename && internal_path == info->filename) {
            std::string buf;
            if (readCurrentEntry(static_cast<uint64_t>(info->uncompressed_size), buf)) {
                latest.swap(buf);
                found = true;
            }
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    if (!found) {
        ARCHIVE_WARN("File {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    content.swap(latest);
    XLBOOK_LOG_ZIP_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

ZipError ZipReader::forEachEntry(const EntryCallback& callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    int32_t status = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (status == MZ_END_OF_LIST) {
        return ZipError::Ok;
    }
    if (status != MZ_OK) {
        return ZipError::BadFormat;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
            return ZipError::BadFormat;
        }

        EntryInfo info;
        info.path = file_info->filename ? file_info->filename : "";
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.is_directory = !info.path.empty() && info.path.back() == '/';
        if (info.path.empty() || info.is_directory) {
            continue;
        }

        std::string content;
        if (!readCurrentEntry(info.uncompressed_size, content)) {
            ARCHIVE_ERROR("Failed to read entry {} from {}", info.path, filename_);
            return ZipError::IoFail;
        }
        XLBOOK_LOG_ZIP_DEBUG("Read entry {} ({} bytes)", info.path, content.size());
        if (!callback(info, std::move(content))) {
            break;
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);

    return ZipError::Ok;
}

}} // namespace xlbook::archive

#include "xlbook/archive/ZipWriter.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>
#include <filesystem>

namespace xlbook {
namespace archive {

ZipWriter::ZipWriter(std::string path)
    : filename_(std::move(path)) {
}

ZipWriter::~ZipWriter() {
    cleanup();
}

ZipError ZipWriter::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (is_open_) {
        return ZipError::Ok;
    }

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return ZipError::InternalError;
    }

    mz_zip_writer_set_compress_method(zip_handle_,
        compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    // 如果文件已存在，先删除
    std::error_code ec;
    if (std::filesystem::exists(filename_, ec)) {
        std::filesystem::remove(filename_, ec);
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filename_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filename_, result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return ZipError::IoFail;
    }

    // 禁用Data Descriptor以避免兼容性问题
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", filename_);
    return ZipError::Ok;
}

ZipError ZipWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    // 幂等：已关闭直接返回
    if (!is_open_ || !zip_handle_) {
        return ZipError::Ok;
    }

    ZipError status = ZipError::Ok;
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filename_, result);
        status = ZipError::IoFail;
    } else {
        ARCHIVE_DEBUG("ZIP file finalized: {} ({} entries)", filename_, written_paths_.size());
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;
    written_paths_.clear();
    return status;
}

void ZipWriter::cleanup() {
    if (is_open_ && zip_handle_) {
        ZipError status = close();
        if (isError(status)) {
            ARCHIVE_WARN("ZIP writer for {} closed with errors during cleanup", filename_);
        }
    } else if (zip_handle_) {
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
}

ZipError ZipWriter::setCompressionLevel(int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < 0 || level > 9) {
        return ZipError::InvalidParameter;
    }
    compression_level_ = level;
    if (zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !zip_handle_) {
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }

    std::string path(internal_path);
    if (written_paths_.find(path) != written_paths_.end()) {
        ARCHIVE_WARN("File {} already exists in zip, skipping duplicate entry", path);
        return ZipError::Ok;
    }

    if (content.size() > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path, content.size());
        return ZipError::TooLarge;
    }

    mz_zip_file file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(content.size());
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;
    std::time_t now = std::time(nullptr);
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    if (!content.empty()) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, content.data(),
                                                          static_cast<int32_t>(content.size()));
        if (bytes_written != static_cast<int32_t>(content.size())) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(std::move(path));
    XLBOOK_LOG_ZIP_DEBUG("Added file {} to zip, size: {} bytes", internal_path, content.size());
    return ZipError::Ok;
}

}} // namespace xlbook::archive

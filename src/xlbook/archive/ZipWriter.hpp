#pragma once

#include "xlbook/archive/ZipError.hpp"
#include <string>
#include <string_view>
#include <mutex>
#include <unordered_set>
#include <cstdint>

namespace xlbook {
namespace archive {

/**
 * @brief ZIP写入器（minizip-ng）
 *
 * 同一路径只写入一次，重复写入被忽略并记录告警。
 * 不使用 Data Descriptor。
 */
class ZipWriter {
public:
    explicit ZipWriter(std::string path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建ZIP文件进行写入（已存在的文件被替换）
     */
    ZipError open();

    /**
     * 写出中央目录并关闭文件
     */
    ZipError close();

    bool isOpen() const { return is_open_; }

    ZipError addFile(std::string_view internal_path, std::string_view content);

    /**
     * 设置压缩级别 0-9，0 表示仅存储
     */
    ZipError setCompressionLevel(int level);

    size_t getEntriesWritten() const { return written_paths_.size(); }

private:
    void cleanup();

    void* zip_handle_ = nullptr;
    std::string filename_;
    bool is_open_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;
    mutable std::mutex mutex_;
};

}} // namespace xlbook::archive

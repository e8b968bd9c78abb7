#pragma once

#include "xlbook/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <string_view>
#include <functional>
#include <mutex>
#include <cstdint>

namespace xlbook {
namespace archive {

/**
 * @brief ZIP读取器（minizip-ng）
 *
 * 读取包内条目。重复出现的同名条目以最后一个为准。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        bool is_directory = false;
    };

    // 逐条目回调：返回 false 终止遍历
    using EntryCallback = std::function<bool(const EntryInfo& info, std::string&& content)>;

    explicit ZipReader(std::string path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开ZIP文件进行读取
     */
    ZipError open();
    void close();
    bool isOpen() const { return is_open_; }

    std::vector<EntryInfo> listEntriesInfo() const;

    /**
     * 提取单个文件到字符串
     */
    ZipError extractFile(std::string_view internal_path, std::string& content);

    /**
     * 依次解压所有非目录条目
     */
    ZipError forEachEntry(const EntryCallback& callback);


private:
    bool readCurrentEntry(uint64_t expected_size, std::string& out) const;
    void cleanup();

    void* unzip_handle_ = nullptr;
    std::string filename_;
    bool is_open_ = false;
    mutable std::mutex mutex_;
};

}} // namespace xlbook::archive

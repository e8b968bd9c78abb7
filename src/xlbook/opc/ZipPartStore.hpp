#pragma once

#include "xlbook/opc/MemoryPartStore.hpp"
#include "xlbook/core/Expected.hpp"
#include <string>

namespace xlbook {
namespace opc {

/**
 * @brief 基于ZIP文件的部件存储
 *
 * load 时一次性解压全部条目到内存，save 时按部件顺序整体写出。
 */
class ZipPartStore : public MemoryPartStore {
public:
    ZipPartStore() = default;
    ~ZipPartStore() override = default;

    /**
     * @brief 从ZIP文件载入所有部件（替换当前内容）
     */
    core::VoidResult load(const std::string& path);

    /**
     * @brief 将所有部件写入ZIP文件
     * @param compression_level 0-9，0 表示仅存储
     */
    core::VoidResult save(const std::string& path, int compression_level = 6) const;

    const std::string& getSourcePath() const { return source_path_; }

private:
    std::string source_path_;
};

}} // namespace xlbook::opc

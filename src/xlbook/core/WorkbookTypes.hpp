#pragma once

#include "xlbook/utils/Logger.hpp"
#include <optional>
#include <string>

namespace xlbook {
namespace core {

/**
 * @brief 工作簿属性选项
 *
 * 每个字段独立可选：未设置表示“不修改”，与设置为 false / 空串不同。
 */
struct WorkbookPropsOptions {
    std::optional<bool> date1904;
    std::optional<bool> filter_privacy;
    std::optional<std::string> code_name;
};

/**
 * @brief 工作簿保护选项
 */
struct WorkbookProtectionOptions {
    std::string algorithm_name;   // 为空时使用 SHA-512
    std::string password;         // 为空时只修改锁定标志
    bool lock_structure = false;
    bool lock_windows = false;

    WorkbookProtectionOptions() = default;
    explicit WorkbookProtectionOptions(const std::string& pwd) : password(pwd) {}
};

/**
 * @brief 工作簿配置
 */
struct WorkbookOptions {
    // 日志
    std::string log_file = "logs/xlbook.log";
    Logger::Level log_level = Logger::Level::INFO;
    bool log_to_console = false;

    // ZIP 保存压缩级别（0-9，0 表示仅存储）
    int compression_level = 6;
};

}} // namespace xlbook::core

#pragma once

// xlbook - 工作簿描述部件处理库

#include <string>
#include <memory>

#include "xlbook/core/WorkbookTypes.hpp"
#include "xlbook/core/Workbook.hpp"
#include "xlbook/core/ErrorCode.hpp"
#include "xlbook/core/Expected.hpp"
#include "xlbook/core/Exception.hpp"
#include "xlbook/core/ExceptionBridge.hpp"

// 版本信息
#define XLBOOK_VERSION_MAJOR 1
#define XLBOOK_VERSION_MINOR 0
#define XLBOOK_VERSION_PATCH 0
#define XLBOOK_VERSION_STRING "1.0.0"

namespace xlbook {

inline std::string getVersion() {
    return XLBOOK_VERSION_STRING;
}

/**
 * @brief 按配置初始化库（日志系统）
 * @return 是否成功
 */
bool initialize(const core::WorkbookOptions& options = core::WorkbookOptions());

/**
 * @brief 清理库资源
 */
void cleanup();

} // namespace xlbook

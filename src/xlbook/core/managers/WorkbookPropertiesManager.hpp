#pragma once

#include "xlbook/core/WorkbookDescriptorCache.hpp"
#include "xlbook/core/WorkbookTypes.hpp"
#include "xlbook/core/Expected.hpp"

namespace xlbook {
namespace core {

/**
 * @brief 工作簿属性管理器 - 读写 <workbookPr> 上的 date1904、filterPrivacy、codeName
 */
class WorkbookPropertiesManager {
public:
    explicit WorkbookPropertiesManager(WorkbookDescriptorCache& cache);

    /**
     * @brief 设置工作簿属性
     * @param options 为 nullptr 时不做任何修改；仅覆盖已设置的字段
     */
    VoidResult setProperties(const WorkbookPropsOptions* options);

    /**
     * @brief 读取工作簿属性，未配置过时所有字段均未设置
     */
    Result<WorkbookPropsOptions> getProperties();

private:
    WorkbookDescriptorCache& cache_;
};

}} // namespace xlbook::core

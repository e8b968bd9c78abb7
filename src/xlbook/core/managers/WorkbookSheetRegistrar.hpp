#pragma once

#include "xlbook/core/WorkbookDescriptorCache.hpp"
#include "xlbook/core/Expected.hpp"
#include <string>
#include <vector>

namespace xlbook {
namespace core {

/**
 * @brief 工作表登记 - 向描述部件的 <sheets> 追加条目
 *
 * 名称与 id 的唯一性由调用方保证。
 */
class WorkbookSheetRegistrar {
public:
    explicit WorkbookSheetRegistrar(WorkbookDescriptorCache& cache);

    /**
     * @brief 追加 {name, sheet_id, "rId" + rid}
     */
    VoidResult registerSheet(const std::string& name, int sheet_id, int rid);

    /**
     * @brief 按标签顺序返回工作表名称
     */
    Result<std::vector<std::string>> getSheetList();

private:
    WorkbookDescriptorCache& cache_;
};

}} // namespace xlbook::core

#pragma once

#include <string>

namespace xlbook {
namespace opc {

/**
 * @brief 包关系条目（.rels 中的 Relationship 元素）
 */
struct Relationship {
    std::string id;          // 如 "rId1"
    std::string type;        // 关系类型 URI
    std::string target;      // 如 "xl/workbook.xml"
    std::string target_mode = "Internal";
};

}} // namespace xlbook::opc

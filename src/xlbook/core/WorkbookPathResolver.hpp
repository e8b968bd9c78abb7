#pragma once

#include "xlbook/opc/RelationshipTable.hpp"
#include <string>

namespace xlbook {
namespace core {

/**
 * @brief 根据包级关系（_rels/.rels）定位工作簿描述部件及其关系文件
 *
 * 每次调用都从关系表重新计算，不缓存结果。
 */
class WorkbookPathResolver {
public:
    explicit WorkbookPathResolver(opc::RelationshipTable& relationships);

    /**
     * @brief officeDocument 关系的目标路径（去除前导 '/'），不存在时返回空串
     */
    std::string resolveDescriptorPath() const;

    /**
     * @brief 描述部件对应的关系文件路径，如 xl/_rels/workbook.xml.rels
     */
    std::string resolveDescriptorRelsPath() const;

    /**
     * @brief 由部件路径推导其关系文件路径
     */
    static std::string relsPathFor(const std::string& part_path);

private:
    opc::RelationshipTable& relationships_;
};

}} // namespace xlbook::core

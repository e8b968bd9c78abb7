#pragma once

#include "BaseSAXParser.hpp"
#include "xlbook/opc/Relationship.hpp"
#include <string>
#include <vector>
#include <unordered_map>

namespace xlbook {
namespace reader {

/**
 * @brief 关系文件（.rels）解析器
 *
 * 解析时同步建立 Id 索引。缺少 Id/Type/Target 的条目被跳过并记录告警。
 */
class RelationshipsParser : public BaseSAXParser {
public:
    RelationshipsParser() = default;
    ~RelationshipsParser() override = default;

    /**
     * @brief 解析关系XML内容
     * @param xml_content XML内容
     * @return 是否解析成功
     */
    bool parse(std::string_view xml_content) {
        clear();
        return parseXML(xml_content);
    }

    const std::vector<opc::Relationship>& getRelationships() const { return relationships_; }

    /**
     * @brief 根据ID查找关系，未找到返回nullptr
     */
    const opc::Relationship* findById(const std::string& id) const;

    std::vector<const opc::Relationship*> findByType(const std::string& type) const;

    void clear() {
        relationships_.clear();
        id_index_.clear();
    }

private:
    std::vector<opc::Relationship> relationships_;

    // ID -> 关系索引
    std::unordered_map<std::string, size_t> id_index_;

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view /*name*/, int /*depth*/) override {}
};

}} // namespace xlbook::reader

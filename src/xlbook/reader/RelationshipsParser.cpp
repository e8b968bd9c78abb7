#include "RelationshipsParser.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int /*depth*/) {
    if (name != "Relationship") {
        // 忽略 <Relationships> 根元素
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    auto target = findAttribute(attributes, "Target");
    auto target_mode = findAttribute(attributes, "TargetMode");

    if (id && type && target && !id->empty() && !type->empty() && !target->empty()) {
        opc::Relationship rel;
        rel.id = *id;
        rel.type = *type;
        rel.target = *target;
        rel.target_mode = target_mode ? *target_mode : "Internal";

        id_index_[rel.id] = relationships_.size();
        relationships_.push_back(std::move(rel));

        XLBOOK_LOG_SAX_DEBUG("Parsed relationship: {} -> {} ({})", *id, *target, *type);
    } else {
        READER_WARN("Skipping incomplete relationship: id='{}', type='{}', target='{}'",
                    id ? *id : "", type ? *type : "", target ? *target : "");
    }
}

const opc::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < relationships_.size()) {
        return &relationships_[it->second];
    }
    return nullptr;
}

std::vector<const opc::Relationship*> RelationshipsParser::findByType(const std::string& type) const {
    std::vector<const opc::Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type == type) {
            result.push_back(&rel);
        }
    }
    return result;
}

}} // namespace xlbook::reader

#include "xlbook/opc/RelationshipTable.hpp"
#include "xlbook/opc/NamespaceRegistry.hpp"
#include "xlbook/reader/RelationshipsParser.hpp"
#include "xlbook/xml/XMLStreamWriter.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <mutex>
#include <fmt/format.h>

namespace xlbook {
namespace opc {

RelationshipTable::RelationshipTable(IPartStore& store)
    : store_(store) {
}

const std::vector<Relationship>& RelationshipTable::loadLocked(const std::string& rels_path) {
    auto it = cache_.find(rels_path);
    if (it != cache_.end()) {
        return it->second;
    }

    std::vector<Relationship> relationships;
    std::string content = store_.readPart(rels_path);
    if (!content.empty()) {
        reader::RelationshipsParser parser;
        if (parser.parse(NamespaceRegistry::namespaceStrictToTransitional(content))) {
            relationships = parser.getRelationships();
        } else {
            OPC_WARN("Relationships part {} is malformed, treating as empty: {}",
                     rels_path, parser.getErrorMessage());
        }
    }

    OPC_DEBUG("Loaded {} relationships from {}", relationships.size(), rels_path);
    return cache_.emplace(rels_path, std::move(relationships)).first->second;
}

std::vector<Relationship> RelationshipTable::relationshipsFor(const std::string& rels_path) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(rels_path);
        if (it != cache_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return loadLocked(rels_path);
}

bool RelationshipTable::findByType(const std::string& rels_path, const std::string& type, Relationship& out) {
    for (const auto& rel : relationshipsFor(rels_path)) {
        if (rel.type == type) {
            out = rel;
            return true;
        }
    }
    return false;
}

std::string RelationshipTable::addRelationship(const std::string& rels_path, Relationship rel) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    loadLocked(rels_path);
    auto& relationships = cache_[rels_path];

    if (rel.id.empty()) {
        // 取第一个未被占用的 rId<n>
        size_t n = relationships.size() + 1;
        auto taken = [&relationships](const std::string& id) {
            for (const auto& r : relationships) {
                if (r.id == id) return true;
            }
            return false;
        };
        while (taken(fmt::format("rId{}", n))) {
            ++n;
        }
        rel.id = fmt::format("rId{}", n);
    }

    std::string id = rel.id;
    relationships.push_back(std::move(rel));
    dirty_.insert(rels_path);
    return id;
}

bool RelationshipTable::flush() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool ok = true;
    for (const auto& path : dirty_) {
        if (!store_.writePart(path, serialize(cache_[path]))) {
            OPC_ERROR("Failed to write relationships part {}", path);
            ok = false;
        }
    }
    if (ok) {
        dirty_.clear();
    }
    return ok;
}

void RelationshipTable::reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    dirty_.clear();
}

std::string RelationshipTable::serialize(const std::vector<Relationship>& relationships) {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Relationships");
    writer.writeAttribute("xmlns", core::Namespaces::kPackageRelationships);

    for (const auto& rel : relationships) {
        writer.startElement("Relationship");
        writer.writeAttribute("Id", rel.id);
        writer.writeAttribute("Type", rel.type);
        writer.writeAttribute("Target", rel.target);
        if (!rel.target_mode.empty() && rel.target_mode != "Internal") {
            writer.writeAttribute("TargetMode", rel.target_mode);
        }
        writer.endElement(); // Relationship
    }

    writer.endElement(); // Relationships
    writer.endDocument();
    return writer.toString();
}

}} // namespace xlbook::opc

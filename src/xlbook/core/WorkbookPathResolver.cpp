#include "xlbook/core/WorkbookPathResolver.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace core {

namespace {
constexpr const char* kPackageRelsPath = "_rels/.rels";
}

WorkbookPathResolver::WorkbookPathResolver(opc::RelationshipTable& relationships)
    : relationships_(relationships) {
}

std::string WorkbookPathResolver::resolveDescriptorPath() const {
    opc::Relationship rel;
    if (!relationships_.findByType(kPackageRelsPath, Namespaces::kOfficeDocumentRelType, rel)) {
        CORE_DEBUG("No officeDocument relationship in {}", kPackageRelsPath);
        return std::string();
    }

    std::string target = rel.target;
    while (!target.empty() && target.front() == '/') {
        target.erase(0, 1);
    }
    return target;
}

std::string WorkbookPathResolver::resolveDescriptorRelsPath() const {
    return relsPathFor(resolveDescriptorPath());
}

std::string WorkbookPathResolver::relsPathFor(const std::string& part_path) {
    if (part_path.empty()) {
        return std::string();
    }

    size_t slash = part_path.rfind('/');
    if (slash == std::string::npos) {
        return "_rels/" + part_path + ".rels";
    }
    return part_path.substr(0, slash) + "/_rels/" + part_path.substr(slash + 1) + ".rels";
}

}} // namespace xlbook::core

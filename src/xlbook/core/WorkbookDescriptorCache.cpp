#include "xlbook/core/WorkbookDescriptorCache.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/core/Exception.hpp"
#include "xlbook/reader/WorkbookDescriptorParser.hpp"
#include "xlbook/xml/WorkbookXMLGenerator.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace core {

namespace {

// 部件中是否含有元素起始标签；仅有空白、XML 声明或注释时视为没有数据
bool containsElement(const std::string& content) {
    size_t pos = content.find('<');
    while (pos != std::string::npos && pos + 1 < content.size()) {
        char next = content[pos + 1];
        if (next != '?' && next != '!') {
            return true;
        }
        pos = content.find('<', pos + 1);
    }
    return false;
}

} // namespace

WorkbookDescriptorCache::WorkbookDescriptorCache(opc::IPartStore& store,
                                                 const WorkbookPathResolver& resolver,
                                                 opc::NamespaceRegistry& namespaces)
    : store_(store), resolver_(resolver), namespaces_(namespaces) {
}

Result<WorkbookDescriptor*> WorkbookDescriptorCache::getOrLoad() {
    if (descriptor_) {
        return descriptor_.get();
    }

    const std::string path = resolver_.resolveDescriptorPath();
    if (path.empty()) {
        CORE_WARN("Workbook part path could not be resolved, starting with an empty descriptor");
    }

    auto descriptor = std::make_unique<WorkbookDescriptor>();
    std::string content = path.empty() ? std::string() : store_.readPart(path);

    std::vector<opc::XmlAttr> root_attributes;
    if (!content.empty() && !containsElement(content)) {
        CORE_DEBUG("Workbook part {} holds no element, starting with an empty descriptor", path);
    } else if (!content.empty()) {
        const std::string transitional = opc::NamespaceRegistry::namespaceStrictToTransitional(content);
        reader::WorkbookDescriptorParser parser;
        if (!parser.parse(transitional)) {
            CORE_ERROR("Failed to decode workbook part {}: {}", path, parser.getErrorMessage());
            return makeError(ErrorCode::XmlParseError,
                             "Failed to decode workbook part: " + parser.getErrorMessage(), path);
        }
        *descriptor = parser.takeDescriptor();
        root_attributes = parser.getRootAttributes();
    }

    if (!path.empty() && !namespaces_.hasRootAttributes(path)) {
        namespaces_.registerRootAttributes(path, root_attributes);
        namespaces_.addNameSpaces(path, {"xmlns:r", Namespaces::kRelationships});
    }

    descriptor_ = std::move(descriptor);
    CORE_DEBUG("Loaded workbook descriptor from '{}' ({} bytes, {} sheets)",
               path, content.size(), descriptor_->sheets.size());
    return descriptor_.get();
}

VoidResult WorkbookDescriptorCache::flush() {
    if (!descriptor_) {
        return success();
    }

    // 解码时截取的兼容块在兼容命名空间下重新挂载
    if (descriptor_->decode_alternate_content) {
        descriptor_->alternate_content = AlternateContent{Namespaces::kMarkupCompatibility,
                                                          *descriptor_->decode_alternate_content};
    }
    descriptor_->decode_alternate_content.reset();

    const std::string path = resolver_.resolveDescriptorPath();
    if (path.empty()) {
        CORE_ERROR("Cannot write workbook descriptor: part path is unresolvable");
        return makeError(ErrorCode::InvalidWorkbook, "Workbook part path is unresolvable");
    }

    std::string output;
    try {
        const std::string encoded = xml::WorkbookXMLGenerator::generate(*descriptor_);
        const std::string prefix = namespaces_.prefixFor(path, Namespaces::kRelationships, "r");
        output = opc::NamespaceRegistry::replaceRelationshipsBytes(
            namespaces_.replaceNameSpaceBytes(path, encoded), prefix);
    } catch (const XlBookException& e) {
        CORE_ERROR("Failed to encode workbook descriptor: {}", e.what());
        return makeError(e.getErrorCode(), e.what(), path);
    }

    if (!store_.writePart(path, output)) {
        CORE_ERROR("Failed to write workbook part {}", path);
        return makeError(ErrorCode::FileWriteError, "Failed to write workbook part", path);
    }

    CORE_DEBUG("Flushed workbook descriptor to {} ({} bytes)", path, output.size());
    return success();
}

void WorkbookDescriptorCache::reset() {
    descriptor_.reset();
}

}} // namespace xlbook::core

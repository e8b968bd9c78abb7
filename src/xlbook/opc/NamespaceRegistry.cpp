#include "xlbook/opc/NamespaceRegistry.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/xml/XMLStreamWriter.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace xlbook {
namespace opc {

namespace {

struct NamespaceTranslation {
    const char* strict;
    const char* transitional;
};

// 关系类型 URI 均以关系命名空间为前缀，整体替换即可覆盖
constexpr NamespaceTranslation kNamespaceTranslations[] = {
    {core::Namespaces::kStrictSpreadsheetML, core::Namespaces::kSpreadsheetML},
    {core::Namespaces::kStrictRelationships, core::Namespaces::kRelationships},
    {"http://purl.oclc.org/ooxml/drawingml/main",
     "http://schemas.openxmlformats.org/drawingml/2006/main"},
    {"http://purl.oclc.org/ooxml/officeDocument/docPropsVTypes",
     "http://schemas.openxmlformats.org/officeDocument/2006/docPropsVTypes"},
    {"http://purl.oclc.org/ooxml/officeDocument/extendedProperties",
     "http://schemas.openxmlformats.org/officeDocument/2006/extended-properties"},
};

void replaceAll(std::string& text, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return;
    }
    size_t pos = 0;
    while ((pos = text.find(from.data(), pos, from.size())) != std::string::npos) {
        text.replace(pos, from.size(), to.data(), to.size());
        pos += to.size();
    }
}

bool isNamespaceDeclaration(const std::string& name) {
    return name == "xmlns" || name.rfind("xmlns:", 0) == 0;
}

// 解析开始标签中的 name="value" 属性对（生成器只输出命名空间 URI，不含需转义字符）
std::vector<XmlAttr> parseTagAttributes(std::string_view tag) {
    std::vector<XmlAttr> attrs;
    size_t pos = 0;
    while (pos < tag.size()) {
        size_t eq = tag.find('=', pos);
        if (eq == std::string_view::npos) break;
        size_t name_start = tag.find_last_of(" \t\r\n", eq);
        if (name_start == std::string_view::npos) break;
        std::string_view name = tag.substr(name_start + 1, eq - name_start - 1);
        if (eq + 1 >= tag.size()) break;
        char quote = tag[eq + 1];
        size_t close = tag.find(quote, eq + 2);
        if (close == std::string_view::npos) break;
        attrs.push_back({std::string(name), std::string(tag.substr(eq + 2, close - eq - 2))});
        pos = close + 1;
    }
    return attrs;
}

} // namespace

bool NamespaceRegistry::hasRootAttributes(const std::string& part_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return xml_attrs_.find(part_path) != xml_attrs_.end();
}

void NamespaceRegistry::registerRootAttributes(const std::string& part_path, const std::vector<XmlAttr>& attrs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stored = xml_attrs_[part_path];
    stored.insert(stored.end(), attrs.begin(), attrs.end());
    OPC_DEBUG("Registered {} root attributes for {}", attrs.size(), part_path);
}

std::vector<XmlAttr> NamespaceRegistry::getRootAttributes(const std::string& part_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = xml_attrs_.find(part_path);
    return it == xml_attrs_.end() ? std::vector<XmlAttr>() : it->second;
}

void NamespaceRegistry::addNameSpaces(const std::string& part_path, const XmlAttr& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& attrs = xml_attrs_[part_path];

    bool uri_bound = std::any_of(attrs.begin(), attrs.end(), [&](const XmlAttr& attr) {
        return isNamespaceDeclaration(attr.name) && attr.value == ns.value;
    });
    if (uri_bound) {
        return;
    }

    std::string name = ns.name;
    auto name_taken = [&attrs](const std::string& candidate) {
        return std::any_of(attrs.begin(), attrs.end(),
                           [&](const XmlAttr& attr) { return attr.name == candidate; });
    };
    for (int suffix = 1; name_taken(name); ++suffix) {
        name = fmt::format("{}{}", ns.name, suffix);
    }

    attrs.push_back({name, ns.value});
    OPC_DEBUG("Added namespace {}=\"{}\" to {}", name, ns.value, part_path);
}

std::string NamespaceRegistry::prefixFor(const std::string& part_path, std::string_view uri,
                                         const std::string& fallback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = xml_attrs_.find(part_path);
    if (it == xml_attrs_.end()) {
        return fallback;
    }
    for (const auto& attr : it->second) {
        if (attr.name.rfind("xmlns:", 0) == 0 && attr.value == uri) {
            return attr.name.substr(6);
        }
    }
    return fallback;
}

std::string NamespaceRegistry::replaceNameSpaceBytes(const std::string& part_path, std::string_view content) const {
    // 定位第一个元素开始标签（跳过 XML 声明）
    size_t open = content.find('<');
    while (open != std::string_view::npos && open + 1 < content.size() &&
           (content[open + 1] == '?' || content[open + 1] == '!')) {
        open = content.find('<', open + 1);
    }
    if (open == std::string_view::npos) {
        return std::string(content);
    }
    size_t close = content.find('>', open);
    if (close == std::string_view::npos) {
        return std::string(content);
    }
    bool self_closing = close > open && content[close - 1] == '/';
    size_t tag_end = self_closing ? close - 1 : close;

    std::string_view tag = content.substr(open + 1, tag_end - open - 1);
    size_t name_end = tag.find_first_of(" \t\r\n");
    std::string_view element_name = name_end == std::string_view::npos ? tag : tag.substr(0, name_end);

    std::vector<XmlAttr> merged = getRootAttributes(part_path);
    std::vector<XmlAttr> generated = parseTagAttributes(tag);

    for (const auto& attr : generated) {
        if (attr.name == fmt::format("xmlns:{}", kNeutralRelationshipsPrefix)) {
            continue;
        }
        bool present = std::any_of(merged.begin(), merged.end(),
                                   [&](const XmlAttr& m) { return m.name == attr.name; });
        if (!present) {
            merged.push_back(attr);
        }
    }

    std::string root;
    root.reserve(tag.size() + 256);
    root.push_back('<');
    root.append(element_name.data(), element_name.size());
    for (const auto& attr : merged) {
        root.push_back(' ');
        root.append(attr.name);
        root.append("=\"");
        root.append(xml::XMLStreamWriter::escapeAttribute(attr.value));
        root.push_back('"');
    }
    root.append(self_closing ? " />" : ">");

    std::string result;
    result.reserve(content.size() + root.size());
    result.append(content.data(), open);
    result.append(root);
    result.append(content.data() + close + 1, content.size() - close - 1);
    return result;
}

std::string NamespaceRegistry::replaceRelationshipsBytes(std::string_view content, const std::string& prefix) {
    std::string result(content);
    // 生成器只在关系 Id 属性上使用中性前缀
    replaceAll(result, fmt::format(" {}:id=\"", kNeutralRelationshipsPrefix), fmt::format(" {}:id=\"", prefix));
    return result;
}

std::string NamespaceRegistry::namespaceStrictToTransitional(std::string_view content) {
    std::string result(content);
    for (const auto& translation : kNamespaceTranslations) {
        replaceAll(result, translation.strict, translation.transitional);
    }
    return result;
}

void NamespaceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    xml_attrs_.clear();
}

}} // namespace xlbook::opc

/**
 * @file WorkbookDescriptorParser.cpp
 * @brief 工作簿描述部件解析器实现
 */

#include "WorkbookDescriptorParser.hpp"
#include "xlbook/core/Constants.hpp"
#include <algorithm>

namespace xlbook {
namespace reader {

bool WorkbookDescriptorParser::parse(std::string_view xml_content) {
    descriptor_ = core::WorkbookDescriptor();
    root_attributes_.clear();
    relationship_id_attr_ = "r:id";
    capture_ = Capture::None;
    capture_name_.clear();
    in_sheets_ = in_book_views_ = in_defined_names_ = in_defined_name_ = false;

    content_ = xml_content;
    bool ok = parseXML(xml_content);
    content_ = std::string_view();

    if (ok) {
        READER_DEBUG("Parsed workbook descriptor: {} sheets, {} defined names, {} raw elements",
                     descriptor_.sheets.size(), descriptor_.defined_names.size(),
                     descriptor_.extra_elements.size());
    }
    return ok;
}

std::string_view WorkbookDescriptorParser::localName(std::string_view name) {
    size_t colon = name.find(':');
    return colon == std::string_view::npos ? name : name.substr(colon + 1);
}

core::AttributeList WorkbookDescriptorParser::toAttributeList(span<const xml::XMLAttribute> attributes) {
    core::AttributeList list;
    list.reserve(attributes.size());
    for (const auto& attr : attributes) {
        list.push_back({std::string(attr.name), std::string(attr.value)});
    }
    return list;
}

void WorkbookDescriptorParser::onStartElement(std::string_view name,
                                              span<const xml::XMLAttribute> attributes, int depth) {
    if (state_.has_error || capture_ != Capture::None) {
        return;
    }

    XLBOOK_LOG_SAX_DEBUG("start <{}> depth {}", name, depth);

    if (depth == 0) {
        handleRoot(name, attributes);
    } else if (depth == 1) {
        handleTopLevel(localName(name), name, attributes);
    } else {
        handleNested(localName(name), attributes);
    }
}

void WorkbookDescriptorParser::onEndElement(std::string_view name, int depth) {
    if (state_.has_error) {
        return;
    }

    if (capture_ != Capture::None) {
        if (depth == 1) {
            finishCapture();
        }
        return;
    }

    std::string_view local = localName(name);
    if (depth == 1) {
        if (local == "sheets") {
            in_sheets_ = false;
        } else if (local == "bookViews") {
            in_book_views_ = false;
        } else if (local == "definedNames") {
            in_defined_names_ = false;
        }
    } else if (depth == 2 && local == "definedName" && in_defined_name_) {
        descriptor_.defined_names.back().formula = getCurrentText();
        stopCollectingText();
        in_defined_name_ = false;
    }
}

void WorkbookDescriptorParser::handleRoot(std::string_view name, span<const xml::XMLAttribute> attributes) {
    if (localName(name) != "workbook") {
        setError(fmt::format("Unexpected root element <{}> in workbook part", name));
        return;
    }

    // 根元素必须绑定到 SpreadsheetML 命名空间（严格命名空间已在解析前改写）
    size_t colon = name.find(':');
    std::string declaration = colon == std::string_view::npos
        ? std::string("xmlns")
        : "xmlns:" + std::string(name.substr(0, colon));
    auto bound = findAttribute(attributes, declaration);
    if (!bound || *bound != core::Namespaces::kSpreadsheetML) {
        setError(fmt::format("Root element <{}> is bound to namespace '{}', expected '{}'",
                             name, bound ? *bound : std::string(), core::Namespaces::kSpreadsheetML));
        return;
    }

    root_attributes_ = toAttributeList(attributes);

    // 工作表 r:id 使用根元素上绑定到关系命名空间的前缀
    for (const auto& attr : root_attributes_) {
        if (attr.name.rfind("xmlns:", 0) == 0 && attr.value == core::Namespaces::kRelationships) {
            relationship_id_attr_ = attr.name.substr(6) + ":id";
            break;
        }
    }
}

void WorkbookDescriptorParser::handleTopLevel(std::string_view local, std::string_view name,
                                              span<const xml::XMLAttribute> attributes) {
    if (local == "fileVersion") {
        core::FileVersion version;
        version.app_name = getAttributeOr(attributes, "appName", "");
        version.last_edited = getAttributeOr(attributes, "lastEdited", "");
        version.lowest_edited = getAttributeOr(attributes, "lowestEdited", "");
        version.rup_build = getAttributeOr(attributes, "rupBuild", "");
        version.code_name = getAttributeOr(attributes, "codeName", "");
        descriptor_.file_version = std::move(version);
    } else if (local == "fileSharing") {
        descriptor_.file_sharing = toAttributeList(attributes);
    } else if (local == "AlternateContent") {
        beginCapture(Capture::AlternateContent, local);
    } else if (local == "workbookPr") {
        parseWorkbookPr(attributes);
    } else if (local == "workbookProtection") {
        parseWorkbookProtection(attributes);
    } else if (local == "bookViews") {
        in_book_views_ = true;
    } else if (local == "sheets") {
        in_sheets_ = true;
    } else if (local == "definedNames") {
        in_defined_names_ = true;
    } else if (local == "calcPr") {
        descriptor_.calc_pr = toAttributeList(attributes);
    } else if (local == "extLst") {
        beginCapture(Capture::ExtLst, local);
    } else {
        READER_DEBUG("Carrying unmodelled element <{}> verbatim", name);
        beginCapture(Capture::RawElement, local);
    }
}

void WorkbookDescriptorParser::handleNested(std::string_view local, span<const xml::XMLAttribute> attributes) {
    if (in_sheets_ && local == "sheet") {
        parseSheet(attributes);
    } else if (in_book_views_ && local == "workbookView") {
        descriptor_.book_views.push_back(toAttributeList(attributes));
    } else if (in_defined_names_ && local == "definedName") {
        parseDefinedName(attributes);
    }
}

void WorkbookDescriptorParser::parseWorkbookPr(span<const xml::XMLAttribute> attributes) {
    core::WorkbookPr pr;
    for (const auto& attr : attributes) {
        if (attr.name == "date1904") {
            pr.date1904 = (attr.value == "1" || attr.value == "true");
        } else if (attr.name == "filterPrivacy") {
            pr.filter_privacy = (attr.value == "1" || attr.value == "true");
        } else if (attr.name == "codeName") {
            pr.code_name = std::string(attr.value);
        } else {
            pr.other_attributes.push_back({std::string(attr.name), std::string(attr.value)});
        }
    }
    descriptor_.properties = std::move(pr);
}

void WorkbookDescriptorParser::parseWorkbookProtection(span<const xml::XMLAttribute> attributes) {
    core::WorkbookProtection protection;
    std::string legacy_password;

    for (const auto& attr : attributes) {
        if (attr.name == "workbookAlgorithmName") {
            protection.algorithm_name = std::string(attr.value);
        } else if (attr.name == "workbookHashValue") {
            protection.hash_value = std::string(attr.value);
        } else if (attr.name == "workbookSaltValue") {
            protection.salt_value = std::string(attr.value);
        } else if (attr.name == "workbookSpinCount") {
            protection.spin_count = getIntAttributeOr(attributes, "workbookSpinCount", 0);
        } else if (attr.name == "lockStructure") {
            protection.lock_structure = (attr.value == "1" || attr.value == "true");
        } else if (attr.name == "lockWindows") {
            protection.lock_windows = (attr.value == "1" || attr.value == "true");
        } else if (attr.name == "workbookPassword") {
            legacy_password = std::string(attr.value);
        } else {
            protection.other_attributes.push_back({std::string(attr.name), std::string(attr.value)});
        }
    }

    if (!legacy_password.empty()) {
        if (protection.algorithm_name.empty() && protection.hash_value.empty()) {
            // 旧式 16 位校验值映射为 XOR 算法
            protection.algorithm_name = "XOR";
            protection.hash_value = std::move(legacy_password);
        } else {
            protection.other_attributes.push_back({"workbookPassword", std::move(legacy_password)});
        }
    }

    descriptor_.protection = std::move(protection);
}

void WorkbookDescriptorParser::parseSheet(span<const xml::XMLAttribute> attributes) {
    core::SheetEntry sheet;
    sheet.name = getAttributeOr(attributes, "name", "");
    sheet.sheet_id = getIntAttributeOr(attributes, "sheetId", 0);
    sheet.relationship_id = getAttributeOr(attributes, relationship_id_attr_, "");
    sheet.state = getAttributeOr(attributes, "state", "");

    if (sheet.name.empty() || sheet.relationship_id.empty()) {
        READER_WARN("Sheet element missing attributes: name='{}', sheetId={}, {}='{}'",
                    sheet.name, sheet.sheet_id, relationship_id_attr_, sheet.relationship_id);
    }
    descriptor_.sheets.push_back(std::move(sheet));
}

void WorkbookDescriptorParser::parseDefinedName(span<const xml::XMLAttribute> attributes) {
    core::DefinedName defined_name;
    defined_name.name = getAttributeOr(attributes, "name", "");
    defined_name.local_sheet_id = findIntAttribute(attributes, "localSheetId");
    defined_name.hidden = getBoolAttributeOr(attributes, "hidden", false);
    defined_name.comment = getAttributeOr(attributes, "comment", "");

    if (defined_name.name.empty()) {
        READER_WARN("definedName element without name attribute");
    }
    descriptor_.defined_names.push_back(std::move(defined_name));
    in_defined_name_ = true;
    startCollectingText();
}

void WorkbookDescriptorParser::beginCapture(Capture kind, std::string_view local) {
    const auto* reader = currentReader();
    if (!reader || reader->currentByteIndex() < 0) {
        setError(fmt::format("Cannot capture <{}>: byte offsets unavailable", local));
        return;
    }
    capture_ = kind;
    capture_name_ = std::string(local);
    capture_outer_start_ = static_cast<size_t>(reader->currentByteIndex());
    capture_inner_start_ = capture_outer_start_ + static_cast<size_t>(reader->currentByteCount());
}

void WorkbookDescriptorParser::finishCapture() {
    const auto* reader = currentReader();
    size_t end_index = static_cast<size_t>(std::max<int64_t>(reader->currentByteIndex(), 0));
    size_t end_count = static_cast<size_t>(reader->currentByteCount());

    // 空元素（<x/>）的结束事件与开始事件重合，内部内容为空
    std::string inner;
    if (end_index > capture_inner_start_ && end_index <= content_.size()) {
        inner = std::string(content_.substr(capture_inner_start_, end_index - capture_inner_start_));
    }

    switch (capture_) {
        case Capture::AlternateContent:
            descriptor_.decode_alternate_content = std::move(inner);
            break;
        case Capture::ExtLst:
            descriptor_.ext_lst = std::move(inner);
            break;
        case Capture::RawElement: {
            size_t outer_end = std::min(content_.size(),
                                        std::max(capture_inner_start_, end_index + end_count));
            core::RawElement raw;
            raw.local_name = capture_name_;
            raw.xml = std::string(content_.substr(capture_outer_start_, outer_end - capture_outer_start_));
            descriptor_.extra_elements.push_back(std::move(raw));
            break;
        }
        case Capture::None:
            break;
    }

    capture_ = Capture::None;
    capture_name_.clear();
}

}} // namespace xlbook::reader

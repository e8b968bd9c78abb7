#include "xlbook/xml/WorkbookXMLGenerator.hpp"
#include "xlbook/opc/NamespaceRegistry.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace xlbook {
namespace xml {

namespace {

// sheets 与 extLst 之间可出现的顶层元素（按 schema 顺序）
constexpr const char* kOrderedSlots[] = {
    "fileVersion", "fileSharing", "workbookPr", "workbookProtection", "bookViews", "sheets",
    "functionGroups", "externalReferences", "definedNames", "calcPr", "oleSize",
    "customWorkbookViews", "pivotCaches", "smartTagPr", "smartTagTypes", "webPublishing",
    "fileRecoveryPr", "webPublishObjects", "extLst"
};

bool isOrderedSlot(const std::string& local_name) {
    return std::any_of(std::begin(kOrderedSlots), std::end(kOrderedSlots),
                       [&](const char* slot) { return local_name == slot; });
}

} // namespace

std::string WorkbookXMLGenerator::generate(const core::WorkbookDescriptor& descriptor) {
    XMLStreamWriter writer;
    writer.startDocument();

    writer.startElement("workbook");
    writer.writeAttribute("xmlns", core::Namespaces::kSpreadsheetML);
    writer.writeAttribute(fmt::format("xmlns:{}", opc::kNeutralRelationshipsPrefix),
                          core::Namespaces::kRelationships);

    if (descriptor.file_version) {
        writeFileVersion(writer, *descriptor.file_version);
    }
    writeRawElements(writer, descriptor, "fileVersion");

    if (descriptor.file_sharing) {
        writeAttributeElement(writer, "fileSharing", *descriptor.file_sharing);
    }
    writeRawElements(writer, descriptor, "fileSharing");

    if (descriptor.alternate_content) {
        writer.startElement("mc:AlternateContent");
        writer.writeAttribute("xmlns:mc", descriptor.alternate_content->xmlns_mc);
        writer.writeRaw(descriptor.alternate_content->content);
        writer.endElement();
    }

    if (descriptor.properties) {
        writeWorkbookPr(writer, *descriptor.properties);
    }
    writeRawElements(writer, descriptor, "workbookPr");

    if (descriptor.protection) {
        writeWorkbookProtection(writer, *descriptor.protection);
    }
    writeRawElements(writer, descriptor, "workbookProtection");

    if (!descriptor.book_views.empty()) {
        writer.startElement("bookViews");
        for (const auto& view : descriptor.book_views) {
            writeAttributeElement(writer, "workbookView", view);
        }
        writer.endElement(); // bookViews
    }
    writeRawElements(writer, descriptor, "bookViews");

    writeSheets(writer, descriptor);
    writeRawElements(writer, descriptor, "sheets");
    writeRawElements(writer, descriptor, "functionGroups");
    writeRawElements(writer, descriptor, "externalReferences");

    writeDefinedNames(writer, descriptor);
    writeRawElements(writer, descriptor, "definedNames");

    if (descriptor.calc_pr) {
        writeAttributeElement(writer, "calcPr", *descriptor.calc_pr);
    }
    writeRawElements(writer, descriptor, "calcPr");

    for (const char* slot : {"oleSize", "customWorkbookViews", "pivotCaches", "smartTagPr",
                             "smartTagTypes", "webPublishing", "fileRecoveryPr", "webPublishObjects"}) {
        writeRawElements(writer, descriptor, slot);
    }
    writeUnorderedRawElements(writer, descriptor);

    if (descriptor.ext_lst) {
        writer.startElement("extLst");
        writer.writeRaw(*descriptor.ext_lst);
        writer.endElement();
    }
    writeRawElements(writer, descriptor, "extLst");

    writer.endElement(); // workbook
    writer.endDocument();

    XML_DEBUG("Generated workbook XML: {} sheets, {} bytes", descriptor.sheets.size(), writer.toString().size());
    return writer.toString();
}

void WorkbookXMLGenerator::writeFileVersion(XMLStreamWriter& writer, const core::FileVersion& version) {
    writer.startElement("fileVersion");
    if (!version.app_name.empty()) writer.writeAttribute("appName", version.app_name);
    if (!version.last_edited.empty()) writer.writeAttribute("lastEdited", version.last_edited);
    if (!version.lowest_edited.empty()) writer.writeAttribute("lowestEdited", version.lowest_edited);
    if (!version.rup_build.empty()) writer.writeAttribute("rupBuild", version.rup_build);
    if (!version.code_name.empty()) writer.writeAttribute("codeName", version.code_name);
    writer.endElement();
}

void WorkbookXMLGenerator::writeWorkbookPr(XMLStreamWriter& writer, const core::WorkbookPr& pr) {
    writer.startElement("workbookPr");
    if (pr.date1904) {
        writer.writeAttribute("date1904", true);
    }
    if (pr.filter_privacy) {
        writer.writeAttribute("filterPrivacy", true);
    }
    if (!pr.code_name.empty()) {
        writer.writeAttribute("codeName", pr.code_name);
    }
    for (const auto& attr : pr.other_attributes) {
        writer.writeAttribute(attr.name, attr.value);
    }
    writer.endElement();
}

void WorkbookXMLGenerator::writeWorkbookProtection(XMLStreamWriter& writer,
                                                   const core::WorkbookProtection& protection) {
    const bool legacy = protection.algorithm_name == "XOR";

    writer.startElement("workbookProtection");
    if (!legacy) {
        if (!protection.algorithm_name.empty()) {
            writer.writeAttribute("workbookAlgorithmName", protection.algorithm_name);
        }
        if (!protection.hash_value.empty()) {
            writer.writeAttribute("workbookHashValue", protection.hash_value);
        }
        if (!protection.salt_value.empty()) {
            writer.writeAttribute("workbookSaltValue", protection.salt_value);
        }
        if (protection.spin_count > 0) {
            writer.writeAttribute("workbookSpinCount", protection.spin_count);
        }
    }
    if (protection.lock_structure) {
        writer.writeAttribute("lockStructure", true);
    }
    if (protection.lock_windows) {
        writer.writeAttribute("lockWindows", true);
    }
    if (legacy && !protection.hash_value.empty()) {
        writer.writeAttribute("workbookPassword", protection.hash_value);
    }
    for (const auto& attr : protection.other_attributes) {
        writer.writeAttribute(attr.name, attr.value);
    }
    writer.endElement();
}

void WorkbookXMLGenerator::writeSheets(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor) {
    const std::string id_attr = fmt::format("{}:id", opc::kNeutralRelationshipsPrefix);

    writer.startElement("sheets");
    for (const auto& sheet : descriptor.sheets) {
        writer.startElement("sheet");
        writer.writeAttribute("name", sheet.name);
        writer.writeAttribute("sheetId", sheet.sheet_id);
        if (!sheet.state.empty()) {
            writer.writeAttribute("state", sheet.state);
        }
        writer.writeAttribute(id_attr, sheet.relationship_id);
        writer.endElement();
    }
    writer.endElement(); // sheets
}

void WorkbookXMLGenerator::writeDefinedNames(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor) {
    if (descriptor.defined_names.empty()) {
        return;
    }

    writer.startElement("definedNames");
    for (const auto& defined_name : descriptor.defined_names) {
        writer.startElement("definedName");
        writer.writeAttribute("name", defined_name.name);
        if (!defined_name.comment.empty()) {
            writer.writeAttribute("comment", defined_name.comment);
        }
        if (defined_name.local_sheet_id) {
            writer.writeAttribute("localSheetId", *defined_name.local_sheet_id);
        }
        if (defined_name.hidden) {
            writer.writeAttribute("hidden", true);
        }
        writer.writeText(defined_name.formula);
        writer.endElement();
    }
    writer.endElement(); // definedNames
}

void WorkbookXMLGenerator::writeAttributeElement(XMLStreamWriter& writer, const std::string& name,
                                                 const core::AttributeList& attributes) {
    writer.startElement(name);
    for (const auto& attr : attributes) {
        writer.writeAttribute(attr.name, attr.value);
    }
    writer.endElement();
}

void WorkbookXMLGenerator::writeRawElements(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor,
                                            const char* local_name) {
    for (const auto& raw : descriptor.extra_elements) {
        if (raw.local_name == local_name) {
            writer.writeRaw(raw.xml);
        }
    }
}

void WorkbookXMLGenerator::writeUnorderedRawElements(XMLStreamWriter& writer,
                                                     const core::WorkbookDescriptor& descriptor) {
    for (const auto& raw : descriptor.extra_elements) {
        if (!isOrderedSlot(raw.local_name)) {
            writer.writeRaw(raw.xml);
        }
    }
}

}} // namespace xlbook::xml

#pragma once

#include "xlbook/core/WorkbookDescriptor.hpp"
#include "xlbook/xml/XMLStreamWriter.hpp"
#include <string>

namespace xlbook {
namespace xml {

/**
 * @brief 工作簿描述部件XML生成器
 *
 * 按 CT_Workbook 元素顺序输出模型。根元素使用规范命名空间：
 * 默认命名空间为 SpreadsheetML，关系命名空间绑定中性前缀 "relationships"，
 * 持久化前缀由 NamespaceRegistry 在编码后改写。
 */
class WorkbookXMLGenerator {
public:
    /**
     * @brief 生成 xl/workbook.xml 内容
     * @param descriptor 工作簿描述模型
     * @return 完整XML文档
     */
    static std::string generate(const core::WorkbookDescriptor& descriptor);

private:
    static void writeFileVersion(XMLStreamWriter& writer, const core::FileVersion& version);
    static void writeWorkbookPr(XMLStreamWriter& writer, const core::WorkbookPr& pr);
    static void writeWorkbookProtection(XMLStreamWriter& writer, const core::WorkbookProtection& protection);
    static void writeSheets(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor);
    static void writeDefinedNames(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor);
    static void writeAttributeElement(XMLStreamWriter& writer, const std::string& name,
                                      const core::AttributeList& attributes);
    static void writeRawElements(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor,
                                 const char* local_name);
    static void writeUnorderedRawElements(XMLStreamWriter& writer, const core::WorkbookDescriptor& descriptor);
};

}} // namespace xlbook::xml

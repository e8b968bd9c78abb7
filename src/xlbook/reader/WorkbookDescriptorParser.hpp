/**
 * @file WorkbookDescriptorParser.hpp
 * @brief 工作簿描述部件（xl/workbook.xml）解析器
 */

#pragma once

#include "BaseSAXParser.hpp"
#include "xlbook/core/WorkbookDescriptor.hpp"
#include "xlbook/opc/NamespaceRegistry.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace xlbook {
namespace reader {

/**
 * @brief 工作簿描述部件流式解析器
 *
 * 元素按本地名匹配（忽略前缀）。一次解析同时得到：
 * - 根元素属性（命名空间声明、mc:Ignorable 等），供 NamespaceRegistry 登记；
 * - WorkbookDescriptor 模型。
 *
 * mc:AlternateContent 与 extLst 的内部 XML、以及未建模的顶层元素
 * 借助 expat 字节偏移从输入中原样截取。
 */
class WorkbookDescriptorParser : public BaseSAXParser {
public:
    WorkbookDescriptorParser() = default;
    ~WorkbookDescriptorParser() override = default;

    /**
     * @brief 解析部件内容
     * @param xml_content 已完成 Strict -> Transitional 转换的内容
     * @return 是否解析成功；失败时模型内容无意义
     */
    bool parse(std::string_view xml_content);

    const core::WorkbookDescriptor& getDescriptor() const { return descriptor_; }

    /**
     * @brief 取走解析结果
     */
    core::WorkbookDescriptor takeDescriptor() { return std::move(descriptor_); }

    const std::vector<opc::XmlAttr>& getRootAttributes() const { return root_attributes_; }

private:
    enum class Capture {
        None,
        AlternateContent,
        ExtLst,
        RawElement
    };

    void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) override;
    void onEndElement(std::string_view name, int depth) override;

    void handleRoot(std::string_view name, span<const xml::XMLAttribute> attributes);
    void handleTopLevel(std::string_view local, std::string_view name, span<const xml::XMLAttribute> attributes);
    void handleNested(std::string_view local, span<const xml::XMLAttribute> attributes);

    void parseWorkbookPr(span<const xml::XMLAttribute> attributes);
    void parseWorkbookProtection(span<const xml::XMLAttribute> attributes);
    void parseSheet(span<const xml::XMLAttribute> attributes);
    void parseDefinedName(span<const xml::XMLAttribute> attributes);

    void beginCapture(Capture kind, std::string_view local);
    void finishCapture();

    static std::string_view localName(std::string_view name);
    static core::AttributeList toAttributeList(span<const xml::XMLAttribute> attributes);

    core::WorkbookDescriptor descriptor_;
    std::vector<opc::XmlAttr> root_attributes_;

    std::string_view content_;
    std::string relationship_id_attr_ = "r:id";

    Capture capture_ = Capture::None;
    std::string capture_name_;
    size_t capture_outer_start_ = 0;
    size_t capture_inner_start_ = 0;

    bool in_sheets_ = false;
    bool in_book_views_ = false;
    bool in_defined_names_ = false;
    bool in_defined_name_ = false;
};

}} // namespace xlbook::reader

#pragma once

#include "xlbook/opc/NamespaceRegistry.hpp"
#include <optional>
#include <string>
#include <vector>

namespace xlbook {
namespace core {

using AttributeList = std::vector<opc::XmlAttr>;

/**
 * @brief <workbookPr> 记录
 */
struct WorkbookPr {
    bool date1904 = false;
    bool filter_privacy = false;
    std::string code_name;
    AttributeList other_attributes;   // defaultThemeVersion 等未建模属性
};

/**
 * @brief <workbookProtection> 记录，存在即表示工作簿受保护
 *
 * salt_value / hash_value 为部件中的 base64 形式；XOR 旧式哈希为 4 位大写十六进制。
 */
struct WorkbookProtection {
    bool lock_structure = false;
    bool lock_windows = false;
    std::string algorithm_name;
    std::string salt_value;
    std::string hash_value;
    int spin_count = 0;
    AttributeList other_attributes;
};

struct SheetEntry {
    std::string name;
    int sheet_id = 0;
    std::string relationship_id;
    std::string state;   // visible / hidden / veryHidden，空表示不输出
};

struct FileVersion {
    std::string app_name;
    std::string last_edited;
    std::string lowest_edited;
    std::string rup_build;
    std::string code_name;
};

struct DefinedName {
    std::string name;
    std::optional<int> local_sheet_id;
    bool hidden = false;
    std::string comment;
    std::string formula;
};

/**
 * @brief mc:AlternateContent 兼容块（内部 XML 原样保存）
 */
struct AlternateContent {
    std::string xmlns_mc;
    std::string content;
};

/**
 * @brief 未建模的顶层元素，按原始外部 XML 保存
 */
struct RawElement {
    std::string local_name;
    std::string xml;
};

/**
 * @brief 工作簿描述部件的内存模型
 *
 * 载入后即为唯一数据源，由 WorkbookDescriptorCache 独占。
 */
struct WorkbookDescriptor {
    std::optional<FileVersion> file_version;
    std::optional<AttributeList> file_sharing;
    std::optional<AlternateContent> alternate_content;
    std::optional<std::string> decode_alternate_content;   // 仅解码阶段使用
    std::optional<WorkbookPr> properties;
    std::optional<WorkbookProtection> protection;
    std::vector<AttributeList> book_views;
    std::vector<SheetEntry> sheets;
    std::vector<DefinedName> defined_names;
    std::optional<AttributeList> calc_pr;
    std::optional<std::string> ext_lst;
    std::vector<RawElement> extra_elements;
};

}} // namespace xlbook::core

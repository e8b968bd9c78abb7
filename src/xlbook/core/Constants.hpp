#pragma once

#include <cstddef>

namespace xlbook {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // 工作簿保护密码哈希的迭代次数
    static constexpr int kWorkbookProtectionSpinCount = 100000;

    // 随机盐长度（字节）
    static constexpr size_t kPasswordSaltLength = 16;

    // 密码字段允许的最大字符数
    static constexpr size_t kMaxPasswordLength = 255;

    // 未指定算法时使用的哈希算法
    static constexpr const char* kDefaultHashAlgorithm = "SHA-512";
};

/**
 * @brief 包内常用命名空间与关系类型 URI
 */
struct Namespaces {
    static constexpr const char* kSpreadsheetML =
        "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
    static constexpr const char* kRelationships =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
    static constexpr const char* kPackageRelationships =
        "http://schemas.openxmlformats.org/package/2006/relationships";
    static constexpr const char* kMarkupCompatibility =
        "http://schemas.openxmlformats.org/markup-compatibility/2006";
    static constexpr const char* kOfficeDocumentRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
    static constexpr const char* kWorksheetRelType =
        "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";

    // Strict 版本 URI，读入时转换为 Transitional
    static constexpr const char* kStrictSpreadsheetML =
        "http://purl.oclc.org/ooxml/spreadsheetml/main";
    static constexpr const char* kStrictRelationships =
        "http://purl.oclc.org/ooxml/officeDocument/relationships";
    static constexpr const char* kStrictOfficeDocumentRelType =
        "http://purl.oclc.org/ooxml/officeDocument/relationships/officeDocument";
};

} // namespace core
} // namespace xlbook

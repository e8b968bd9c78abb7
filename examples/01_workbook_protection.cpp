/**
 * @file 01_workbook_protection.cpp
 * @brief 工作簿属性与结构保护示例
 *
 * 创建工作簿、登记工作表、设置属性并以密码保护结构，保存后重新打开校验密码。
 */

#include "xlbook/XlBook.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <iostream>

using namespace xlbook;

int main(int argc, char* argv[]) {
    const std::string output = argc > 1 ? argv[1] : "protected_workbook.xlsx";

    core::WorkbookOptions options;
    options.log_to_console = true;
    if (!xlbook::initialize(options)) {
        std::cerr << "Failed to initialize xlbook" << std::endl;
        return 1;
    }

    EXAMPLE_INFO("xlbook {} workbook protection example", getVersion());

    auto workbook = core::Workbook::create(options);
    auto result = workbook->registerSheet("Summary", 1, 1);
    if (result) {
        result = workbook->registerSheet("Data", 2, 2);
    }

    core::WorkbookPropsOptions props;
    props.date1904 = false;
    props.code_name = "ThisWorkbook";
    if (result) {
        result = workbook->setWorkbookProps(&props);
    }

    core::WorkbookProtectionOptions protection("secret");
    protection.lock_structure = true;
    if (result) {
        result = workbook->protectWorkbook(&protection);
    }

    if (result) {
        result = workbook->saveAs(output);
    }
    if (!result) {
        EXAMPLE_ERROR("Failed to build {}: {}", output, result.error().fullMessage());
        xlbook::cleanup();
        return 1;
    }
    EXAMPLE_INFO("Saved {}", output);

    // 重新打开并校验密码
    auto reopened = core::Workbook::open(output, options);
    if (!reopened) {
        EXAMPLE_ERROR("Failed to reopen {}: {}", output, reopened.error().fullMessage());
        xlbook::cleanup();
        return 1;
    }

    auto wrong = reopened.value()->unprotectWorkbook("guess");
    EXAMPLE_INFO("Unprotect with wrong password: {}", wrong ? std::string("accepted") : wrong.error().message);

    auto right = reopened.value()->unprotectWorkbook("secret");
    EXAMPLE_INFO("Unprotect with correct password: {}", right ? std::string("accepted") : right.error().message);

    xlbook::cleanup();
    return right ? 0 : 1;
}

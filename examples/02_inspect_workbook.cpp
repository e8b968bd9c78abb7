/**
 * @file 02_inspect_workbook.cpp
 * @brief 读取已有工作簿的描述部件信息
 */

#include "xlbook/XlBook.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <iostream>

using namespace xlbook;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <workbook.xlsx>" << std::endl;
        return 1;
    }

    core::WorkbookOptions options;
    if (!xlbook::initialize(options)) {
        std::cerr << "Failed to initialize xlbook" << std::endl;
        return 1;
    }

    try {
        auto workbook = core::ExceptionBridge::unwrap(core::Workbook::open(argv[1], options));

        std::cout << "Descriptor: " << workbook->getDescriptorPath() << std::endl;

        auto props = core::ExceptionBridge::unwrap(workbook->getWorkbookProps());
        if (props.date1904) {
            std::cout << "date1904: " << (*props.date1904 ? "true" : "false") << std::endl;
            std::cout << "filterPrivacy: " << (*props.filter_privacy ? "true" : "false") << std::endl;
            std::cout << "codeName: " << *props.code_name << std::endl;
        } else {
            std::cout << "workbookPr: not configured" << std::endl;
        }

        for (const auto& name : core::ExceptionBridge::unwrap(workbook->getSheetList())) {
            std::cout << "sheet: " << name << std::endl;
        }

        auto protection = workbook->getSecurityManager().getProtection();
        if (protection) {
            const std::string algorithm = protection->algorithm_name.empty() ? "none" : protection->algorithm_name;
            std::cout << "protected: algorithm=" << algorithm
                      << " lockStructure=" << protection->lock_structure
                      << " lockWindows=" << protection->lock_windows << std::endl;
        } else {
            std::cout << "protected: no" << std::endl;
        }
    } catch (const core::XlBookException& e) {
        EXAMPLE_ERROR("Failed to inspect {}: {}", argv[1], e.what());
        std::cerr << e.what() << std::endl;
        xlbook::cleanup();
        return 1;
    }

    xlbook::cleanup();
    return 0;
}

#include "XlBook.hpp"
#include "xlbook/utils/Logger.hpp"
#include <iostream>

namespace xlbook {

bool initialize(const core::WorkbookOptions& options) {
    try {
        Logger::getInstance().initialize(options.log_file, options.log_level, options.log_to_console);
        XLBOOK_LOG_INFO("xlbook library initialized, version {}", getVersion());
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize xlbook: " << e.what() << std::endl;
        return false;
    }
}

void cleanup() {
    XLBOOK_LOG_INFO("xlbook library cleanup completed");
    Logger::getInstance().shutdown();
}

} // namespace xlbook

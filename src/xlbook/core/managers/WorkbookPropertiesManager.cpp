#include "WorkbookPropertiesManager.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace core {

WorkbookPropertiesManager::WorkbookPropertiesManager(WorkbookDescriptorCache& cache)
    : cache_(cache) {
}

VoidResult WorkbookPropertiesManager::setProperties(const WorkbookPropsOptions* options) {
    if (!options) {
        return success();
    }

    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }
    WorkbookDescriptor* descriptor = *loaded;

    if (!descriptor->properties) {
        descriptor->properties.emplace();
    }
    WorkbookPr& pr = *descriptor->properties;

    if (options->date1904) {
        pr.date1904 = *options->date1904;
    }
    if (options->filter_privacy) {
        pr.filter_privacy = *options->filter_privacy;
    }
    if (options->code_name) {
        pr.code_name = *options->code_name;
    }

    CORE_DEBUG("Workbook properties updated: date1904={}, filterPrivacy={}, codeName='{}'",
               pr.date1904, pr.filter_privacy, pr.code_name);
    return success();
}

Result<WorkbookPropsOptions> WorkbookPropertiesManager::getProperties() {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    WorkbookPropsOptions options;
    const WorkbookDescriptor* descriptor = *loaded;
    if (descriptor->properties) {
        options.date1904 = descriptor->properties->date1904;
        options.filter_privacy = descriptor->properties->filter_privacy;
        options.code_name = descriptor->properties->code_name;
    }
    return options;
}

}} // namespace xlbook::core

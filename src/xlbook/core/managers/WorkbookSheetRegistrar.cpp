#include "WorkbookSheetRegistrar.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace core {

WorkbookSheetRegistrar::WorkbookSheetRegistrar(WorkbookDescriptorCache& cache)
    : cache_(cache) {
}

VoidResult WorkbookSheetRegistrar::registerSheet(const std::string& name, int sheet_id, int rid) {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    SheetEntry entry;
    entry.name = name;
    entry.sheet_id = sheet_id;
    entry.relationship_id = fmt::format("rId{}", rid);
    (*loaded)->sheets.push_back(std::move(entry));

    CORE_DEBUG("Registered sheet '{}' (sheetId={}, rId{})", name, sheet_id, rid);
    return success();
}

Result<std::vector<std::string>> WorkbookSheetRegistrar::getSheetList() {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    std::vector<std::string> names;
    names.reserve((*loaded)->sheets.size());
    for (const auto& sheet : (*loaded)->sheets) {
        names.push_back(sheet.name);
    }
    return names;
}

}} // namespace xlbook::core

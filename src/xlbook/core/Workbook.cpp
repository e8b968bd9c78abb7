#include "xlbook/core/Workbook.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/xml/XMLStreamWriter.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"

namespace xlbook {
namespace core {

namespace {

constexpr const char* kContentTypesPath = "[Content_Types].xml";
constexpr const char* kPackageRelsPath = "_rels/.rels";
constexpr const char* kDefaultWorkbookPath = "xl/workbook.xml";

std::string buildContentTypes() {
    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("Types");
    writer.writeAttribute("xmlns", "http://schemas.openxmlformats.org/package/2006/content-types");

    writer.startElement("Default");
    writer.writeAttribute("Extension", "rels");
    writer.writeAttribute("ContentType", "application/vnd.openxmlformats-package.relationships+xml");
    writer.endElement();

    writer.startElement("Default");
    writer.writeAttribute("Extension", "xml");
    writer.writeAttribute("ContentType", "application/xml");
    writer.endElement();

    writer.startElement("Override");
    writer.writeAttribute("PartName", "/xl/workbook.xml");
    writer.writeAttribute("ContentType", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml");
    writer.endElement();

    writer.endElement(); // Types
    writer.endDocument();
    return writer.toString();
}

} // namespace

Workbook::Workbook(const WorkbookOptions& options)
    : options_(options)
    , relationships_(store_)
    , resolver_(relationships_)
    , cache_(store_, resolver_, namespaces_)
    , properties_(cache_)
    , security_(cache_)
    , sheets_(cache_) {
}

std::unique_ptr<Workbook> Workbook::create(const WorkbookOptions& options) {
    auto workbook = std::make_unique<Workbook>(options);
    workbook->initializePackage();
    CORE_INFO("Created new workbook package");
    return workbook;
}

Result<std::unique_ptr<Workbook>> Workbook::open(const std::string& path, const WorkbookOptions& options) {
    auto workbook = std::make_unique<Workbook>(options);
    auto result = workbook->load(path);
    if (!result) {
        return result.error();
    }
    return std::move(workbook);
}

void Workbook::initializePackage() {
    store_.clear();
    relationships_.reset();
    namespaces_.clear();
    cache_.reset();

    if (!store_.writePart(kContentTypesPath, buildContentTypes())) {
        CORE_ERROR("Failed to write {}", kContentTypesPath);
    }

    opc::Relationship office_document;
    office_document.type = Namespaces::kOfficeDocumentRelType;
    office_document.target = kDefaultWorkbookPath;
    relationships_.addRelationship(kPackageRelsPath, office_document);

    const std::string workbook_rels = WorkbookPathResolver::relsPathFor(kDefaultWorkbookPath);
    if (!store_.writePart(workbook_rels, opc::RelationshipTable::serialize({}))) {
        CORE_ERROR("Failed to write {}", workbook_rels);
    }

    if (!relationships_.flush()) {
        CORE_ERROR("Failed to write package relationships");
    }

    // 新包立即持有描述部件，保存时一并写出
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        CORE_ERROR("Failed to initialize workbook descriptor: {}", loaded.error().message);
    }
}

VoidResult Workbook::load(const std::string& path) {
    auto result = store_.load(path);
    if (!result) {
        CORE_ERROR("Failed to open workbook {}: {}", path, result.error().fullMessage());
        return result;
    }

    relationships_.reset();
    namespaces_.clear();
    cache_.reset();
    filename_ = path;

    if (resolver_.resolveDescriptorPath().empty()) {
        CORE_WARN("Package {} has no officeDocument relationship", path);
    }
    CORE_INFO("Opened workbook {}", path);
    return success();
}

VoidResult Workbook::save() {
    if (filename_.empty()) {
        CORE_ERROR("Workbook has no file name, use saveAs");
        return makeError(ErrorCode::InvalidArgument, "Workbook has no file name");
    }
    return saveAs(filename_);
}

VoidResult Workbook::saveAs(const std::string& path) {
    auto flushed = cache_.flush();
    if (!flushed) {
        return flushed;
    }

    if (!relationships_.flush()) {
        return makeError(ErrorCode::FileWriteError, "Failed to write relationship parts", path);
    }

    auto saved = store_.save(path, options_.compression_level);
    if (!saved) {
        CORE_ERROR("Failed to save workbook {}: {}", path, saved.error().fullMessage());
        return saved;
    }

    filename_ = path;
    CORE_INFO("Saved workbook {}", path);
    return success();
}

VoidResult Workbook::setWorkbookProps(const WorkbookPropsOptions* options) {
    return properties_.setProperties(options);
}

Result<WorkbookPropsOptions> Workbook::getWorkbookProps() {
    return properties_.getProperties();
}

VoidResult Workbook::protectWorkbook(const WorkbookProtectionOptions* options) {
    return security_.protect(options);
}

VoidResult Workbook::unprotectWorkbook() {
    return security_.unprotect();
}

VoidResult Workbook::unprotectWorkbook(const std::string& password) {
    return security_.unprotect(password);
}

Result<bool> Workbook::isWorkbookProtected() {
    return security_.isProtected();
}

VoidResult Workbook::registerSheet(const std::string& name, int sheet_id, int rid) {
    return sheets_.registerSheet(name, sheet_id, rid);
}

Result<std::vector<std::string>> Workbook::getSheetList() {
    return sheets_.getSheetList();
}

Result<WorkbookDescriptor*> Workbook::getDescriptor() {
    return cache_.getOrLoad();
}

VoidResult Workbook::flushDescriptor() {
    return cache_.flush();
}

std::string Workbook::getDescriptorPath() const {
    return resolver_.resolveDescriptorPath();
}

}} // namespace xlbook::core

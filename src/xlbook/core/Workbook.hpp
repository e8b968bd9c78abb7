#pragma once

#include "xlbook/core/WorkbookTypes.hpp"
#include "xlbook/core/WorkbookDescriptor.hpp"
#include "xlbook/core/WorkbookPathResolver.hpp"
#include "xlbook/core/WorkbookDescriptorCache.hpp"
#include "xlbook/core/managers/WorkbookPropertiesManager.hpp"
#include "xlbook/core/managers/WorkbookSecurityManager.hpp"
#include "xlbook/core/managers/WorkbookSheetRegistrar.hpp"
#include "xlbook/core/Expected.hpp"
#include "xlbook/opc/ZipPartStore.hpp"
#include "xlbook/opc/RelationshipTable.hpp"
#include "xlbook/opc/NamespaceRegistry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace xlbook {
namespace core {

/**
 * @brief 工作簿包句柄
 *
 * 持有部件存储、关系表、命名空间登记表与描述部件缓存，
 * 属性、保护、工作表登记均通过本类转发。
 * 描述部件的修改在 save / saveAs / flushDescriptor 时才写回。
 */
class Workbook {
public:
    explicit Workbook(const WorkbookOptions& options = WorkbookOptions());
    ~Workbook() = default;

    Workbook(const Workbook&) = delete;
    Workbook& operator=(const Workbook&) = delete;

    // ========== 工厂方法 ==========

    /**
     * @brief 创建只含最小包结构的新工作簿
     */
    static std::unique_ptr<Workbook> create(const WorkbookOptions& options = WorkbookOptions());

    /**
     * @brief 打开已有的 xlsx 包
     */
    static Result<std::unique_ptr<Workbook>> open(const std::string& path,
                                                  const WorkbookOptions& options = WorkbookOptions());

    // ========== 保存 ==========

    /**
     * @brief 保存到打开时的路径
     */
    VoidResult save();

    VoidResult saveAs(const std::string& path);

    const std::string& getFilename() const { return filename_; }

    // ========== 工作簿属性 ==========

    VoidResult setWorkbookProps(const WorkbookPropsOptions* options);
    Result<WorkbookPropsOptions> getWorkbookProps();

    // ========== 工作簿保护 ==========

    VoidResult protectWorkbook(const WorkbookProtectionOptions* options);

    /**
     * @brief 不带密码时无条件取消保护
     */
    VoidResult unprotectWorkbook();
    VoidResult unprotectWorkbook(const std::string& password);

    Result<bool> isWorkbookProtected();

    // ========== 工作表 ==========

    VoidResult registerSheet(const std::string& name, int sheet_id, int rid);
    Result<std::vector<std::string>> getSheetList();

    // ========== 描述部件 ==========

    Result<WorkbookDescriptor*> getDescriptor();
    VoidResult flushDescriptor();

    std::string getDescriptorPath() const;

    // ========== 组件访问 ==========

    opc::ZipPartStore& getPartStore() { return store_; }
    WorkbookSecurityManager& getSecurityManager() { return security_; }
    const WorkbookOptions& getOptions() const { return options_; }

private:
    VoidResult load(const std::string& path);
    void initializePackage();

    WorkbookOptions options_;
    std::string filename_;

    opc::ZipPartStore store_;
    opc::RelationshipTable relationships_;
    opc::NamespaceRegistry namespaces_;
    WorkbookPathResolver resolver_;
    WorkbookDescriptorCache cache_;

    WorkbookPropertiesManager properties_;
    WorkbookSecurityManager security_;
    WorkbookSheetRegistrar sheets_;
};

}} // namespace xlbook::core

#pragma once

#include "xlbook/core/WorkbookDescriptorCache.hpp"
#include "xlbook/core/WorkbookTypes.hpp"
#include "xlbook/core/Constants.hpp"
#include "xlbook/core/Expected.hpp"
#include <string>

namespace xlbook {
namespace core {

/**
 * @brief 工作簿安全管理器 - 负责工作簿结构保护
 *
 * 保护状态即 <workbookProtection> 记录是否存在。密码以加盐、迭代的哈希
 * 形式记录在部件中，本类不负责强制执行保护。
 * 所有修改操作在哈希计算成功后才触及模型，失败时模型保持不变。
 */
class WorkbookSecurityManager {
public:
    explicit WorkbookSecurityManager(WorkbookDescriptorCache& cache);

    WorkbookSecurityManager(const WorkbookSecurityManager&) = delete;
    WorkbookSecurityManager& operator=(const WorkbookSecurityManager&) = delete;

    /**
     * @brief 保护工作簿
     *
     * 锁定标志总是按选项设置。密码非空时以 algorithm_name（默认 SHA-512）
     * 和新的随机盐重新计算哈希；密码为空时保留已有哈希。
     *
     * @param options 为 nullptr 时等同于默认选项
     */
    VoidResult protect(const WorkbookProtectionOptions* options);

    /**
     * @brief 无条件取消保护（不校验密码）
     */
    VoidResult unprotect();

    /**
     * @brief 校验密码后取消保护
     * @return 未保护时 WorkbookNotProtected，密码不符时 WrongPassword
     */
    VoidResult unprotect(const std::string& password);

    Result<bool> isProtected();

    /**
     * @brief 获取保护记录，未保护时返回 WorkbookNotProtected
     */
    Result<WorkbookProtection> getProtection();

private:
    WorkbookDescriptorCache& cache_;
};

}} // namespace xlbook::core

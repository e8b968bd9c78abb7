#include "WorkbookSecurityManager.hpp"
#include "xlbook/security/PasswordHasher.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>

namespace xlbook {
namespace core {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::toupper(static_cast<unsigned char>(x)) == std::toupper(static_cast<unsigned char>(y));
           });
}

} // namespace

WorkbookSecurityManager::WorkbookSecurityManager(WorkbookDescriptorCache& cache)
    : cache_(cache) {
}

VoidResult WorkbookSecurityManager::protect(const WorkbookProtectionOptions* options) {
    const WorkbookProtectionOptions defaults;
    const WorkbookProtectionOptions& opts = options ? *options : defaults;

    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    // 先完成哈希计算，失败时不修改模型
    std::string algorithm = opts.algorithm_name.empty() ? Constants::kDefaultHashAlgorithm : opts.algorithm_name;
    security::PasswordHash derived;
    if (!opts.password.empty()) {
        auto hash = security::PasswordHasher::derivePasswordHash(opts.password, algorithm, "",
                                                                   Constants::kWorkbookProtectionSpinCount);
        if (!hash) {
            SECURITY_ERROR("Workbook protection rejected: {}", hash.error().message);
            return hash.error();
        }
        derived = std::move(hash).value();
    }

    WorkbookDescriptor* descriptor = *loaded;
    if (!descriptor->protection) {
        descriptor->protection.emplace();
    }
    WorkbookProtection& protection = *descriptor->protection;
    protection.lock_structure = opts.lock_structure;
    protection.lock_windows = opts.lock_windows;

    if (!opts.password.empty()) {
        protection.algorithm_name = algorithm;
        protection.hash_value = derived.hash;
        protection.salt_value = derived.salt;
        protection.spin_count = derived.salt.empty() ? 0 : Constants::kWorkbookProtectionSpinCount;
        SECURITY_INFO("Workbook protected with {} password hash", algorithm);
    } else {
        SECURITY_INFO("Workbook lock flags set: structure={}, windows={}",
                      protection.lock_structure, protection.lock_windows);
    }
    return success();
}

VoidResult WorkbookSecurityManager::unprotect() {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    WorkbookDescriptor* descriptor = *loaded;
    if (descriptor->protection) {
        descriptor->protection.reset();
        SECURITY_INFO("Workbook protection removed without password verification");
    }
    return success();
}

VoidResult WorkbookSecurityManager::unprotect(const std::string& password) {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }

    WorkbookDescriptor* descriptor = *loaded;
    if (!descriptor->protection) {
        SECURITY_WARN("Unprotect requested but workbook is not protected");
        return makeError(ErrorCode::WorkbookNotProtected, "Workbook is not protected");
    }

    const WorkbookProtection& protection = *descriptor->protection;
    if (!protection.algorithm_name.empty()) {
        auto hash = security::PasswordHasher::derivePasswordHash(password, protection.algorithm_name,
                                                                 protection.salt_value, protection.spin_count);
        if (!hash) {
            return hash.error();
        }

        // XOR 校验值为十六进制，大小写不敏感
        bool matched = protection.algorithm_name == "XOR"
            ? equalsIgnoreCase(hash->hash, protection.hash_value)
            : hash->hash == protection.hash_value;
        if (!matched) {
            SECURITY_WARN("Workbook unprotect failed: wrong password");
            return makeError(ErrorCode::WrongPassword, "The password provided does not match");
        }
    }

    descriptor->protection.reset();
    SECURITY_INFO("Workbook protection removed");
    return success();
}

Result<bool> WorkbookSecurityManager::isProtected() {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }
    return (*loaded)->protection.has_value();
}

Result<WorkbookProtection> WorkbookSecurityManager::getProtection() {
    auto loaded = cache_.getOrLoad();
    if (!loaded) {
        return loaded.error();
    }
    if (!(*loaded)->protection) {
        return makeError(ErrorCode::WorkbookNotProtected, "Workbook is not protected");
    }
    return *(*loaded)->protection;
}

}} // namespace xlbook::core

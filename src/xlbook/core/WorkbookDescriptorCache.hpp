#pragma once

#include "xlbook/core/WorkbookDescriptor.hpp"
#include "xlbook/core/WorkbookPathResolver.hpp"
#include "xlbook/core/Expected.hpp"
#include "xlbook/opc/IPartStore.hpp"
#include "xlbook/opc/NamespaceRegistry.hpp"
#include <memory>

namespace xlbook {
namespace core {

/**
 * @brief 工作簿描述部件缓存
 *
 * 首次访问时从部件存储读取并解码，之后内存模型为唯一数据源；
 * flush 时编码并回写，同时恢复命名空间声明与关系前缀。
 * 假定同一时刻只有一个修改者。
 */
class WorkbookDescriptorCache {
public:
    WorkbookDescriptorCache(opc::IPartStore& store,
                            const WorkbookPathResolver& resolver,
                            opc::NamespaceRegistry& namespaces);
    ~WorkbookDescriptorCache() = default;

    WorkbookDescriptorCache(const WorkbookDescriptorCache&) = delete;
    WorkbookDescriptorCache& operator=(const WorkbookDescriptorCache&) = delete;

    /**
     * @brief 获取缓存的描述模型，未载入时载入
     *
     * 部件缺失或为空时得到空模型；内容无法解析时返回 XmlParseError，
     * 不缓存任何内容，下次调用重新尝试。
     */
    Result<WorkbookDescriptor*> getOrLoad();

    /**
     * @brief 将模型编码写回部件存储，未载入时不做任何事
     */
    VoidResult flush();

    bool isLoaded() const { return descriptor_ != nullptr; }

    /**
     * @brief 丢弃缓存（部件存储被整体替换后调用）
     */
    void reset();

private:
    opc::IPartStore& store_;
    const WorkbookPathResolver& resolver_;
    opc::NamespaceRegistry& namespaces_;
    std::unique_ptr<WorkbookDescriptor> descriptor_;
};

}} // namespace xlbook::core

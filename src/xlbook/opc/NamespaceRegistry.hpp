#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace xlbook {
namespace opc {

/**
 * @brief 根元素属性（限定名 + 值），如 {"xmlns:r", "http://..."}
 */
struct XmlAttr {
    std::string name;
    std::string value;
};

/**
 * @brief 部件根元素命名空间登记表
 *
 * 解码时记录每个部件根元素上的属性（命名空间声明、mc:Ignorable 等），
 * 编码后用这些属性替换生成器输出的规范根标签，使未知命名空间得以保留。
 */
class NamespaceRegistry {
public:
    NamespaceRegistry() = default;

    bool hasRootAttributes(const std::string& part_path) const;

    /**
     * @brief 记录部件根元素属性（追加到已有记录之后）
     */
    void registerRootAttributes(const std::string& part_path, const std::vector<XmlAttr>& attrs);

    std::vector<XmlAttr> getRootAttributes(const std::string& part_path) const;

    /**
     * @brief 确保部件声明了给定命名空间
     *
     * ns.name 为 "xmlns:<prefix>"。URI 已被任一前缀绑定时不做任何修改；
     * 前缀被其他 URI 占用时改用 <prefix>1、<prefix>2 ...
     */
    void addNameSpaces(const std::string& part_path, const XmlAttr& ns);

    /**
     * @brief 查找部件中绑定到 uri 的前缀，未绑定时返回 fallback
     */
    std::string prefixFor(const std::string& part_path, std::string_view uri, const std::string& fallback) const;

    /**
     * @brief 用登记的根属性替换内容中第一个元素开始标签的属性
     *
     * 生成器输出中的 xmlns 声明若未被登记属性覆盖则保留；
     * 中性前缀 xmlns:relationships 的声明总是丢弃。
     */
    std::string replaceNameSpaceBytes(const std::string& part_path, std::string_view content) const;

    /**
     * @brief 把生成器输出的中性前缀 relationships:id 改写为持久化前缀
     */
    static std::string replaceRelationshipsBytes(std::string_view content, const std::string& prefix);

    /**
     * @brief 将 Strict 命名空间 URI 替换为对应的 Transitional URI
     */
    static std::string namespaceStrictToTransitional(std::string_view content);

    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<XmlAttr>> xml_attrs_;
};

/**
 * @brief 生成器输出中关系 Id 属性使用的中性前缀
 */
constexpr const char* kNeutralRelationshipsPrefix = "relationships";

}} // namespace xlbook::opc

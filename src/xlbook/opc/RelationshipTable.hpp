#pragma once

#include "xlbook/opc/Relationship.hpp"
#include "xlbook/opc/IPartStore.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <shared_mutex>

namespace xlbook {
namespace opc {

/**
 * @brief 关系表：按 .rels 路径惰性解析并缓存关系列表
 *
 * 读取者持共享锁，首次加载与修改持独占锁。
 */
class RelationshipTable {
public:
    explicit RelationshipTable(IPartStore& store);

    /**
     * @brief 获取 rels_path 中的关系（缺失或无法解析时为空列表）
     */
    std::vector<Relationship> relationshipsFor(const std::string& rels_path);

    /**
     * @brief 查找第一个指定类型的关系
     * @return 是否找到
     */
    bool findByType(const std::string& rels_path, const std::string& type, Relationship& out);

    /**
     * @brief 追加关系，id 为空时自动分配 rId<n>
     * @return 实际使用的 id
     */
    std::string addRelationship(const std::string& rels_path, Relationship rel);

    /**
     * @brief 将修改过的关系表序列化回存储
     * @return 全部写入成功
     */
    bool flush();

    /**
     * @brief 丢弃全部缓存（存储被整体替换后调用）
     */
    void reset();

    /**
     * @brief 生成 .rels 部件内容
     */
    static std::string serialize(const std::vector<Relationship>& relationships);

private:
    const std::vector<Relationship>& loadLocked(const std::string& rels_path);

    IPartStore& store_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::vector<Relationship>> cache_;
    std::unordered_set<std::string> dirty_;
};

}} // namespace xlbook::opc

#pragma once

#include <string>
#include <vector>

namespace xlbook {
namespace opc {

/**
 * @brief 包部件存储接口
 *
 * 以包内路径（不带前导 '/'）寻址部件内容。
 */
class IPartStore {
public:
    virtual ~IPartStore() = default;

    /**
     * @brief 读取部件内容，部件不存在时返回空串
     */
    virtual std::string readPart(const std::string& part_name) const = 0;

    /**
     * @brief 写入（新增或替换）部件内容
     * @return 是否写入成功
     */
    virtual bool writePart(const std::string& part_name, const std::string& content) = 0;

    virtual bool partExists(const std::string& part_name) const = 0;
    virtual bool removePart(const std::string& part_name) = 0;

    /**
     * @brief 按写入顺序列出所有部件
     */
    virtual std::vector<std::string> listParts() const = 0;

    virtual size_t getPartCount() const = 0;
};

}} // namespace xlbook::opc

#pragma once

#include "xlbook/opc/IPartStore.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>

namespace xlbook {
namespace opc {

/**
 * @brief 内存部件存储，保持部件首次写入的顺序
 */
class MemoryPartStore : public IPartStore {
public:
    MemoryPartStore() = default;
    ~MemoryPartStore() override = default;

    std::string readPart(const std::string& part_name) const override;
    bool writePart(const std::string& part_name, const std::string& content) override;
    bool partExists(const std::string& part_name) const override;
    bool removePart(const std::string& part_name) override;
    std::vector<std::string> listParts() const override;
    size_t getPartCount() const override;

    void clear();

protected:
    mutable std::mutex mutex_;
    std::vector<std::string> order_;
    std::unordered_map<std::string, std::string> parts_;
};

}} // namespace xlbook::opc

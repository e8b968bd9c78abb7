#include "xlbook/opc/MemoryPartStore.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <algorithm>

namespace xlbook {
namespace opc {

std::string MemoryPartStore::readPart(const std::string& part_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = parts_.find(part_name);
    if (it == parts_.end()) {
        OPC_DEBUG("Part {} not present", part_name);
        return std::string();
    }
    return it->second;
}

bool MemoryPartStore::writePart(const std::string& part_name, const std::string& content) {
    if (part_name.empty()) {
        OPC_ERROR("Cannot write part with empty name");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = parts_.find(part_name);
    if (it == parts_.end()) {
        order_.push_back(part_name);
        parts_.emplace(part_name, content);
    } else {
        it->second = content;
    }
    OPC_DEBUG("Wrote part {} ({} bytes)", part_name, content.size());
    return true;
}

bool MemoryPartStore::partExists(const std::string& part_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.find(part_name) != parts_.end();
}

bool MemoryPartStore::removePart(const std::string& part_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (parts_.erase(part_name) == 0) {
        return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), part_name), order_.end());
    return true;
}

std::vector<std::string> MemoryPartStore::listParts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_;
}

size_t MemoryPartStore::getPartCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parts_.size();
}

void MemoryPartStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    order_.clear();
    parts_.clear();
}

}} // namespace xlbook::opc

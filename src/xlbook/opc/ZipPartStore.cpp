#include "xlbook/opc/ZipPartStore.hpp"
#include "xlbook/archive/ZipReader.hpp"
#include "xlbook/archive/ZipWriter.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbook {
namespace opc {

core::VoidResult ZipPartStore::load(const std::string& path) {
    archive::ZipReader reader(path);
    archive::ZipError status = reader.open();
    if (archive::isError(status)) {
        return core::makeError(archive::toErrorCode(status), "Failed to open package", path);
    }

    std::vector<std::string> order;
    std::unordered_map<std::string, std::string> parts;

    status = reader.forEachEntry([&](const archive::ZipReader::EntryInfo& info, std::string&& content) {
        auto it = parts.find(info.path);
        if (it == parts.end()) {
            order.push_back(info.path);
            parts.emplace(info.path, std::move(content));
        } else {
            // 重复条目以最后一个为准
            it->second = std::move(content);
        }
        return true;
    });
    reader.close();

    if (archive::isError(status)) {
        return core::makeError(archive::toErrorCode(status), "Failed to read package entries", path);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        order_ = std::move(order);
        parts_ = std::move(parts);
    }
    source_path_ = path;

    OPC_INFO("Loaded package {} ({} parts)", path, getPartCount());
    return core::success();
}

core::VoidResult ZipPartStore::save(const std::string& path, int compression_level) const {
    archive::ZipWriter writer(path);
    archive::ZipError status = writer.setCompressionLevel(compression_level);
    if (archive::isError(status)) {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               fmt::format("Invalid compression level {}", compression_level));
    }

    status = writer.open();
    if (archive::isError(status)) {
        return core::makeError(archive::toErrorCode(status), "Failed to create package", path);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& name : order_) {
        auto it = parts_.find(name);
        if (it == parts_.end()) {
            continue;
        }
        status = writer.addFile(name, it->second);
        if (archive::isError(status)) {
            OPC_ERROR("Failed to write part {} to {}", name, path);
            // 失败路径上的关闭结果不覆盖原始错误
            (void)writer.close();
            return core::makeError(archive::toErrorCode(status), fmt::format("Failed to write part {}", name), path);
        }
    }

    status = writer.close();
    if (archive::isError(status)) {
        return core::makeError(archive::toErrorCode(status), "Failed to finalize package", path);
    }

    OPC_INFO("Saved package {} ({} parts)", path, order_.size());
    return core::success();
}

}} // namespace xlbook::opc

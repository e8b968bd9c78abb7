#pragma once

#include "xlbook/core/ErrorCode.hpp"

namespace xlbook {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 文件太大
    FileNotFound,         // 文件未找到
    InvalidParameter,     // 无效参数
    InternalError         // 内部错误
};

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

/**
 * @brief ZIP 错误码映射到统一错误码
 */
inline core::ErrorCode toErrorCode(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return core::ErrorCode::Ok;
        case ZipError::FileNotFound:     return core::ErrorCode::FileNotFound;
        case ZipError::BadFormat:        return core::ErrorCode::FileCorrupted;
        case ZipError::InvalidParameter: return core::ErrorCode::InvalidArgument;
        case ZipError::IoFail:           return core::ErrorCode::FileWriteError;
        default:                         return core::ErrorCode::ZipError;
    }
}

}} // namespace xlbook::archive

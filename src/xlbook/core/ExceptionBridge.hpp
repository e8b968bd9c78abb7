/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和用户层Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <type_traits>
#include <new>

namespace xlbook {
namespace core {

/**
 * @brief 异常转换层
 *
 * 底层组件返回 Result/VoidResult；需要异常语义的调用方通过 unwrap 转换，
 * 反方向通过 wrapCall 把可能抛出的调用收敛为 Result。
 */
class ExceptionBridge {
public:
    /**
     * @brief 将Result转换为异常抛出
     * @throws XlBookException 如果result包含错误
     */
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
        return std::move(result).value();
    }

    template<typename T>
    static T unwrap(const Result<T>& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
        return result.value();
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwError(result.error());
        }
    }

    /**
     * @brief 捕获异常并转换为VoidResult
     */
    template<typename F>
    static VoidResult wrapVoidCall(F&& func) {
        try {
            func();
            return success();
        } catch (const XlBookException& e) {
            return makeError(e.getErrorCode(), e.what());
        } catch (const std::bad_alloc&) {
            return makeError(ErrorCode::OutOfMemory, "Memory allocation failed");
        } catch (const std::exception& e) {
            return makeError(ErrorCode::InternalError, e.what());
        }
    }
};

}} // namespace xlbook::core

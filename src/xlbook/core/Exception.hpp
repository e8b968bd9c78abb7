/**
 * @file Exception.hpp
 * @brief xlbook 异常类定义
 */

#ifndef XLBOOK_EXCEPTION_HPP
#define XLBOOK_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace xlbook {
namespace core {

/**
 * @brief xlbook 基础异常类
 */
class XlBookException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    XlBookException(const std::string& message,
                    ErrorCode code = ErrorCode::InternalError,
                    const char* file = nullptr,
                    int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    /**
     * @brief 获取详细错误信息（含错误码与源码位置）
     */
    std::string getDetailedMessage() const;

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 文件相关异常
 */
class FileException : public XlBookException {
public:
    FileException(const std::string& message, const std::string& filename,
                  ErrorCode code = ErrorCode::FileNotFound,
                  const char* file = nullptr, int line = 0);

    const std::string& getFilename() const { return filename_; }

private:
    std::string filename_;
};

/**
 * @brief 参数相关异常
 */
class ParameterException : public XlBookException {
public:
    ParameterException(const std::string& message,
                       const std::string& parameter_name = "",
                       const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 操作相关异常
 */
class OperationException : public XlBookException {
public:
    OperationException(const std::string& message,
                       const std::string& operation = "",
                       ErrorCode code = ErrorCode::InvalidArgument,
                       const char* file = nullptr, int line = 0);

    const std::string& getOperation() const { return operation_; }

private:
    std::string operation_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public XlBookException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

/**
 * @brief 工作簿保护相关异常（算法不支持、未保护、密码错误）
 */
class SecurityException : public XlBookException {
public:
    SecurityException(const std::string& message,
                      ErrorCode code = ErrorCode::WrongPassword,
                      const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace xlbook

#endif // XLBOOK_EXCEPTION_HPP

/**
 * @file Exception.cpp
 * @brief xlbook 异常类实现
 */

#include "Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace xlbook {
namespace core {

XlBookException::XlBookException(const std::string& message,
                                 ErrorCode code,
                                 const char* file,
                                 int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string XlBookException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << toString(error_code_) << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void XlBookException::addContext(const std::string& context) {
    context_.push_back(context);
}

FileException::FileException(const std::string& message, const std::string& filename,
                             ErrorCode code, const char* file, int line)
    : XlBookException(filename.empty() ? message : fmt::format("{} (file: {})", message, filename),
                      code, file, line)
    , filename_(filename) {
}

ParameterException::ParameterException(const std::string& message,
                                       const std::string& parameter_name,
                                       const char* file, int line)
    : XlBookException(parameter_name.empty() ? message : fmt::format("{} (parameter: {})", message, parameter_name),
                      ErrorCode::InvalidArgument, file, line)
    , parameter_name_(parameter_name) {
}

OperationException::OperationException(const std::string& message,
                                       const std::string& operation,
                                       ErrorCode code, const char* file, int line)
    : XlBookException(operation.empty() ? message : fmt::format("{} (operation: {})", message, operation),
                      code, file, line)
    , operation_(operation) {
}

XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line,
                           const char* file, int line)
    : XlBookException(xml_path.empty() ? message : fmt::format("{} (xml: {})", message, xml_path),
                      ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

SecurityException::SecurityException(const std::string& message,
                                     ErrorCode code,
                                     const char* file, int line)
    : XlBookException(message, code, file, line) {
}

void throwError(const Error& error) {
    switch (error.code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::FileAccessDenied:
        case ErrorCode::FileCorrupted:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileReadError:
        case ErrorCode::ZipError:
            throw FileException(error.fullMessage(), "", error.code);

        case ErrorCode::InvalidArgument:
            throw ParameterException(error.fullMessage());

        case ErrorCode::XmlParseError:
        case ErrorCode::XmlInvalidFormat:
        case ErrorCode::XmlMissingElement:
            throw XMLException(error.fullMessage());

        case ErrorCode::UnsupportedHashAlgorithm:
        case ErrorCode::WorkbookNotProtected:
        case ErrorCode::WrongPassword:
        case ErrorCode::CryptoFailure:
            throw SecurityException(error.fullMessage(), error.code);

        case ErrorCode::InvalidWorkbook:
        case ErrorCode::InvalidRelationship:
            throw OperationException(error.fullMessage(), "", error.code);

        default:
            throw XlBookException(error.fullMessage(), error.code);
    }
}

}} // namespace xlbook::core

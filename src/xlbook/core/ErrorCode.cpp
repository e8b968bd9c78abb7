#include "xlbook/core/ErrorCode.hpp"

namespace xlbook {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::OutOfMemory:
            return "Out of memory";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileAccessDenied:
            return "File access denied";
        case ErrorCode::FileCorrupted:
            return "File corrupted";
        case ErrorCode::FileWriteError:
            return "File write error";
        case ErrorCode::FileReadError:
            return "File read error";

        // 工作簿格式错误
        case ErrorCode::InvalidWorkbook:
            return "Invalid workbook";
        case ErrorCode::InvalidRelationship:
            return "Invalid relationship";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlInvalidFormat:
            return "Invalid XML format";
        case ErrorCode::XmlMissingElement:
            return "Missing XML element";

        // 保护与加密错误
        case ErrorCode::UnsupportedHashAlgorithm:
            return "Unsupported hash algorithm";
        case ErrorCode::WorkbookNotProtected:
            return "Workbook is not protected";
        case ErrorCode::WrongPassword:
            return "Password does not match";
        case ErrorCode::CryptoFailure:
            return "Cryptographic operation failed";

        default:
            return "Unknown error";
    }
}

}} // namespace xlbook::core

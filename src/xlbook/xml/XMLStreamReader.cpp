#include "xlbook/xml/XMLStreamReader.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <cstring>
#include <limits>
#include <fmt/format.h>

namespace xlbook {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    // 非命名空间模式：前缀保留在元素名中，xmlns 声明作为普通属性上报
    parser_ = XML_ParserCreate(nullptr);
    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    collecting_text_ = false;
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setErrorCallback(ErrorCallback callback) {
    error_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setCollectText(bool collect) {
    collect_text_ = collect;
}

XMLParseError XMLStreamReader::parseFromString(std::string_view xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    resetState();

    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }
    if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
        handleError(XMLParseError::InvalidInput, "XML buffer too large");
        return XMLParseError::InvalidInput;
    }

    if (!initializeParser()) {
        return last_error_;
    }

    // 使用ParseBuffer API，整块输入一次解析，字节偏移即输入偏移
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }
    std::memcpy(expat_buffer, buffer, size);

    if (XML_ParseBuffer(parser_, static_cast<int>(size), 1) == XML_STATUS_ERROR) {
        if (last_error_ == XMLParseError::CallbackError) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }

    XML_DEBUG("Parsed {} bytes, {} elements", size, elements_parsed_);
    return XMLParseError::Ok;
}

int XMLStreamReader::getCurrentLineNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentLineNumber(parser_)) : -1;
}

int XMLStreamReader::getCurrentColumnNumber() const {
    return parser_ ? static_cast<int>(XML_GetCurrentColumnNumber(parser_)) : -1;
}

int64_t XMLStreamReader::currentByteIndex() const {
    return parser_ ? static_cast<int64_t>(XML_GetCurrentByteIndex(parser_)) : -1;
}

int XMLStreamReader::currentByteCount() const {
    return parser_ ? XML_GetCurrentByteCount(parser_) : 0;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->flushText();

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;

    auto attributes = reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, attributes, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopOnCallbackError("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
    reader->current_text_.clear();
    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    reader->flushText();
    reader->current_depth_--;

    std::string_view element_name{name, std::strlen(name)};

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->stopOnCallbackError("End element", e);
            return;
        }
    }

    reader->collecting_text_ = reader->collect_text_;
}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    XMLStreamReader* reader = static_cast<XMLStreamReader*>(userData);

    if (reader->collecting_text_ && len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

// 把累积的文本交给回调（在下一个标签事件之前）
void XMLStreamReader::flushText() {
    if (current_text_.empty()) {
        return;
    }
    std::string_view text_content = trim_whitespace_ ?
        trimStringView(current_text_) : std::string_view{current_text_};

    if (!text_content.empty() && text_callback_) {
        try {
            text_callback_(text_content, current_depth_);
        } catch (const std::exception& e) {
            stopOnCallbackError("Text", e);
        }
    }
    current_text_.clear();
}

span<const XMLAttribute> XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();

    if (attrs) {
        for (int i = 0; attrs[i]; i += 2) {
            if (attrs[i + 1]) {
                attribute_pool_.emplace_back(
                    std::string_view{attrs[i], std::strlen(attrs[i])},
                    std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])}
                );
            }
        }
    }

    return span<const XMLAttribute>{attribute_pool_.data(), attribute_pool_.size()};
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::stopOnCallbackError(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;

    XML_ERROR("XML parse error: {}", message);

    if (error_callback_) {
        try {
            error_callback_(error, message, getCurrentLineNumber(), getCurrentColumnNumber());
        } catch (const std::exception& e) {
            XML_ERROR("Error in error callback: {}", e.what());
        }
    }
}

}} // namespace xlbook::xml

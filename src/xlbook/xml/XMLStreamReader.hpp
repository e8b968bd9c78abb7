#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <functional>
#include <cstdint>
#include <expat.h>
#include "xlbook/core/Constants.hpp"
#include "xlbook/core/span.hpp"

namespace xlbook {
namespace xml {

using namespace xlbook::core;

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * SAX 事件通过回调分发，属性与元素名以 string_view 直接引用 expat 缓冲区，
 * 仅在回调期间有效。
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError          // 回调函数错误
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性结构（零拷贝）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v)
        : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, span<const XMLAttribute> attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;
    using ErrorCallback = std::function<void(XMLParseError error, const std::string& message, int line, int column)>;

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);
    void setErrorCallback(ErrorCallback callback);

    void setTrimWhitespace(bool trim);
    void setCollectText(bool collect);

    XMLParseError parseFromString(std::string_view xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    int getCurrentLineNumber() const;
    int getCurrentColumnNumber() const;

    /**
     * @brief 当前事件在输入中的起始字节偏移（仅在回调中有效）
     */
    int64_t currentByteIndex() const;

    /**
     * @brief 当前事件覆盖的字节数，开始标签事件即整个标签长度
     */
    int currentByteCount() const;

private:
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    span<const XMLAttribute> parseAttributes(const XML_Char** attrs);
    std::string_view trimStringView(std::string_view str) const;
    void flushText();
    void handleError(XMLParseError error, const std::string& message);
    void stopOnCallbackError(const char* stage, const std::exception& e);

    XML_Parser parser_ = nullptr;

    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    // 属性缓存池（每个开始标签复用）
    std::vector<XMLAttribute> attribute_pool_;

    std::string current_text_;
    bool collecting_text_ = false;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;
    ErrorCallback error_callback_;

    bool trim_whitespace_ = true;
    bool collect_text_ = true;

    size_t elements_parsed_ = 0;
};

}} // namespace xlbook::xml

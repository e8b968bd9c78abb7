/**
 * @file XMLStreamWriter.hpp
 * @brief 内存缓冲XML流写入器
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <stack>

namespace xlbook {
namespace xml {

/**
 * @brief XML流写入器
 *
 * 属性先缓存在 pending 列表中，在元素开始标签闭合时一次性写出；
 * 没有子内容的元素以自闭合形式输出。
 * 误用（空名称、在元素外写属性、多余的 endElement）抛出异常。
 */
class XMLStreamWriter {
public:
    XMLStreamWriter();
    ~XMLStreamWriter() = default;

    XMLStreamWriter(const XMLStreamWriter&) = delete;
    XMLStreamWriter& operator=(const XMLStreamWriter&) = delete;

    /**
     * @brief 文档操作
     */
    void startDocument(const std::string& encoding = "UTF-8", bool standalone = true);
    void endDocument();

    /**
     * @brief 元素操作
     */
    void startElement(const std::string& name);
    void endElement();
    void writeEmptyElement(const std::string& name);

    /**
     * @brief 属性操作
     */
    void writeAttribute(const std::string& name, const std::string& value);
    void writeAttribute(const std::string& name, std::string_view value);
    void writeAttribute(const std::string& name, const char* value);
    void writeAttribute(const std::string& name, int value);
    void writeAttribute(const std::string& name, bool value);

    /**
     * @brief 文本内容操作
     */
    void writeText(std::string_view text);
    void writeRaw(std::string_view data);

    void clear();

    /**
     * @brief 获取输出结果
     */
    const std::string& toString() const { return buffer_; }
    bool isEmpty() const { return buffer_.empty(); }
    size_t getDepth() const { return element_stack_.size(); }

    static std::string escapeAttribute(std::string_view value);
    static std::string escapeText(std::string_view text);

private:
    struct PendingAttribute {
        std::string key;
        std::string value;

        PendingAttribute(std::string k, std::string v)
            : key(std::move(k)), value(std::move(v)) {}
    };

    void requireOpenElement(const std::string& name);
    void ensureElementClosed();
    void writeAttributesToBuffer();

    std::string buffer_;
    std::stack<std::string> element_stack_;
    bool in_element_ = false;
    std::vector<PendingAttribute> pending_attributes_;
};

}} // namespace xlbook::xml

#pragma once

#include "xlbook/xml/XMLStreamReader.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include "xlbook/core/span.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <fmt/format.h>

namespace xlbook {
namespace reader {

using xlbook::core::span;

/**
 * @brief 通用SAX解析器基类
 *
 * 基于 XMLStreamReader 的事件回调，维护元素栈与文本收集状态，
 * 并提供属性提取工具。子类只需实现 onStartElement / onEndElement。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        // 元素栈用于跟踪嵌套结构
        std::vector<std::string> element_stack;

        int current_depth = 0;

        std::string current_text;
        bool collecting_text = false;

        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }

        // 检查是否在指定元素内
        bool isInElement(std::string_view element_name) const {
            for (const auto& name : element_stack) {
                if (name == element_name) return true;
            }
            return false;
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功
     */
    bool parseXML(std::string_view xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            state_.has_error = true;
            state_.error_message = "Empty XML content";
            return false;
        }

        xml::XMLStreamReader reader;
        reader_ = &reader;

        reader.setStartElementCallback([this](std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });

        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(name, depth);
        });

        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        reader.setErrorCallback([this](xml::XMLParseError, const std::string& message, int line, int column) {
            state_.has_error = true;
            state_.error_message = fmt::format("XML Parse Error at line {}, column {}: {}", line, column, message);
        });

        auto result = reader.parseFromString(xml_content);
        reader_ = nullptr;

        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                state_.has_error = true;
                state_.error_message = "XML parsing failed";
            }
            READER_ERROR("SAX Parser Error: {}", state_.error_message);
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void handleStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) {
        state_.element_stack.emplace_back(name);
        state_.current_depth = depth;
        state_.current_text.clear();
        onStartElement(name, attributes, depth);
    }

    virtual void handleEndElement(std::string_view name, int depth) {
        state_.current_depth = depth;
        onEndElement(name, depth);
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        state_.current_text.clear();
    }

    virtual void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    virtual void onStartElement(std::string_view name, span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    /**
     * @brief 快速属性查找
     */
    std::optional<std::string> findAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) const {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    std::optional<int> findIntAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) const {
        auto val = findAttribute(attributes, name);
        if (val) {
            try {
                return std::stoi(*val);
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<bool> findBoolAttribute(span<const xml::XMLAttribute> attributes, std::string_view name) const {
        auto val = findAttribute(attributes, name);
        if (val) {
            const std::string& value = *val;
            return (value == "1" || value == "true" || value == "True" || value == "TRUE");
        }
        return std::nullopt;
    }

    std::string getAttributeOr(span<const xml::XMLAttribute> attributes, std::string_view name, const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    int getIntAttributeOr(span<const xml::XMLAttribute> attributes, std::string_view name, int default_value) const {
        auto val = findIntAttribute(attributes, name);
        return val ? *val : default_value;
    }

    bool getBoolAttributeOr(span<const xml::XMLAttribute> attributes, std::string_view name, bool default_value) const {
        auto val = findBoolAttribute(attributes, name);
        return val ? *val : default_value;
    }

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    /**
     * @brief 设置错误状态
     */
    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("Parser Error: {}", message);
    }

    bool isInElement(std::string_view element_name) const {
        return state_.isInElement(element_name);
    }

    const std::string& getCurrentText() const {
        return state_.current_text;
    }

    /**
     * @brief 解析过程中访问底层读取器（用于获取字节偏移），解析结束后为空
     */
    const xml::XMLStreamReader* currentReader() const {
        return reader_;
    }

private:
    const xml::XMLStreamReader* reader_ = nullptr;
};

}} // namespace xlbook::reader

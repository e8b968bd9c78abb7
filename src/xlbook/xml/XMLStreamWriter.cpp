#include "xlbook/xml/XMLStreamWriter.hpp"
#include "xlbook/xml/XMLEscapes.hpp"
#include "xlbook/core/Exception.hpp"
#include "xlbook/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace xlbook {
namespace xml {

XMLStreamWriter::XMLStreamWriter() {
    buffer_.reserve(4096);
}

void XMLStreamWriter::startDocument(const std::string& encoding, bool standalone) {
    buffer_.append("<?xml version=\"1.0\" encoding=\"");
    buffer_.append(encoding);
    buffer_.append(standalone ? "\" standalone=\"yes\"?>\n" : "\"?>\n");
}

void XMLStreamWriter::endDocument() {
    while (!element_stack_.empty()) {
        endElement();
    }
}

void XMLStreamWriter::startElement(const std::string& name) {
    if (name.empty()) {
        throw core::ParameterException("Element name cannot be empty", "name", __FILE__, __LINE__);
    }

    ensureElementClosed();

    buffer_.push_back('<');
    buffer_.append(name);

    element_stack_.push(name);
    in_element_ = true;
}

void XMLStreamWriter::endElement() {
    if (element_stack_.empty()) {
        throw core::OperationException("No element to close", "endElement",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }

    std::string element_name = std::move(element_stack_.top());
    element_stack_.pop();

    if (in_element_) {
        // 自闭合元素
        writeAttributesToBuffer();
        buffer_.append(" />");
        in_element_ = false;
    } else {
        buffer_.append("</");
        buffer_.append(element_name);
        buffer_.push_back('>');
    }
}

void XMLStreamWriter::writeEmptyElement(const std::string& name) {
    startElement(name);
    endElement();
}

void XMLStreamWriter::requireOpenElement(const std::string& name) {
    if (!in_element_) {
        throw core::OperationException("Cannot write attribute outside of element", "writeAttribute",
                                       core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    if (name.empty()) {
        throw core::ParameterException("Attribute name cannot be empty", "name", __FILE__, __LINE__);
    }
}

void XMLStreamWriter::writeAttribute(const std::string& name, const std::string& value) {
    requireOpenElement(name);
    pending_attributes_.emplace_back(name, value);
}

void XMLStreamWriter::writeAttribute(const std::string& name, std::string_view value) {
    requireOpenElement(name);
    pending_attributes_.emplace_back(name, std::string(value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, const char* value) {
    writeAttribute(name, std::string_view(value ? value : ""));
}

void XMLStreamWriter::writeAttribute(const std::string& name, int value) {
    requireOpenElement(name);
    pending_attributes_.emplace_back(name, fmt::format("{}", value));
}

void XMLStreamWriter::writeAttribute(const std::string& name, bool value) {
    requireOpenElement(name);
    pending_attributes_.emplace_back(name, value ? std::string("1") : std::string("0"));
}

void XMLStreamWriter::writeText(std::string_view text) {
    if (text.empty()) {
        return;
    }
    ensureElementClosed();
    buffer_.append(escapeText(text));
}

void XMLStreamWriter::writeRaw(std::string_view data) {
    ensureElementClosed();
    buffer_.append(data.data(), data.size());
}

void XMLStreamWriter::clear() {
    buffer_.clear();
    while (!element_stack_.empty()) {
        element_stack_.pop();
    }
    in_element_ = false;
    pending_attributes_.clear();
}

void XMLStreamWriter::ensureElementClosed() {
    if (in_element_) {
        writeAttributesToBuffer();
        buffer_.push_back('>');
        in_element_ = false;
    }
}

void XMLStreamWriter::writeAttributesToBuffer() {
    for (const auto& attr : pending_attributes_) {
        buffer_.push_back(' ');
        buffer_.append(attr.key);
        buffer_.append("=\"");
        buffer_.append(escapeAttribute(attr.value));
        buffer_.push_back('"');
    }
    pending_attributes_.clear();
}

std::string XMLStreamWriter::escapeAttribute(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 8);
    for (char c : value) {
        switch (c) {
            case '&':  out.append(XMLEscapes::AMP);  break;
            case '<':  out.append(XMLEscapes::LT);   break;
            case '>':  out.append(XMLEscapes::GT);   break;
            case '"':  out.append(XMLEscapes::QUOT); break;
            case '\n': out.append(XMLEscapes::NL);   break;
            case '\t': out.append(XMLEscapes::TAB);  break;
            case '\r': out.append(XMLEscapes::CR);   break;
            default:   out.push_back(c);             break;
        }
    }
    return out;
}

std::string XMLStreamWriter::escapeText(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '&': out.append(XMLEscapes::AMP); break;
            case '<': out.append(XMLEscapes::LT);  break;
            case '>': out.append(XMLEscapes::GT);  break;
            default:  out.push_back(c);            break;
        }
    }
    return out;
}

}} // namespace xlbook::xml

#include "xlbook/xml/XMLStreamWriter.hpp"
#include "xlbook/core/Exception.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace xlbook {
namespace xml {

namespace {
const std::string kDeclaration = "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n";
}

class XMLStreamWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        writer = std::make_unique<XMLStreamWriter>();
    }

    std::unique_ptr<XMLStreamWriter> writer;
};

TEST_F(XMLStreamWriterTest, BasicDocumentCreation) {
    writer->startDocument();
    writer->startElement("root");
    writer->writeAttribute("version", "1.0");
    writer->writeText("Hello World");
    writer->endElement();
    writer->endDocument();

    EXPECT_EQ(writer->toString(), kDeclaration + "<root version=\"1.0\">Hello World</root>");
}

TEST_F(XMLStreamWriterTest, EmptyElement) {
    writer->startDocument();
    writer->writeEmptyElement("empty");
    writer->endDocument();

    EXPECT_EQ(writer->toString(), kDeclaration + "<empty />");
}

TEST_F(XMLStreamWriterTest, NestedElements) {
    writer->startElement("root");
    writer->startElement("child");
    writer->writeAttribute("attr", "value");
    writer->writeText("content");
    writer->endElement();
    writer->endElement();

    EXPECT_EQ(writer->toString(), "<root><child attr=\"value\">content</child></root>");
}

TEST_F(XMLStreamWriterTest, TextEscaping) {
    writer->startElement("test");
    writer->writeText("Special chars: < > & \" '");
    writer->endElement();

    EXPECT_EQ(writer->toString(), "<test>Special chars: &lt; &gt; &amp; \" '</test>");
}

TEST_F(XMLStreamWriterTest, AttributeEscaping) {
    writer->startElement("test");
    writer->writeAttribute("attr", "Special: < > & \" '");
    writer->endElement();

    EXPECT_EQ(writer->toString(), "<test attr=\"Special: &lt; &gt; &amp; &quot; '\" />");
}

TEST_F(XMLStreamWriterTest, TypedAttributes) {
    writer->startElement("test");
    writer->writeAttribute("int", 100000);
    writer->writeAttribute("on", true);
    writer->writeAttribute("off", false);
    writer->writeAttribute("view", std::string_view("normal"));
    writer->endElement();

    EXPECT_EQ(writer->toString(), "<test int=\"100000\" on=\"1\" off=\"0\" view=\"normal\" />");
}

TEST_F(XMLStreamWriterTest, NewlineEscapingInAttributes) {
    writer->startElement("test");
    writer->writeAttribute("attr", "Line1\nLine2");
    writer->endElement();

    EXPECT_NE(writer->toString().find("attr=\"Line1&#xA;Line2\""), std::string::npos);
}

TEST_F(XMLStreamWriterTest, RawContentClosesPendingTag) {
    writer->startElement("mc:AlternateContent");
    writer->writeAttribute("xmlns:mc", "urn:mc");
    writer->writeRaw("<mc:Choice Requires=\"x15\"/>");
    writer->endElement();

    EXPECT_EQ(writer->toString(),
              "<mc:AlternateContent xmlns:mc=\"urn:mc\"><mc:Choice Requires=\"x15\"/></mc:AlternateContent>");
}

TEST_F(XMLStreamWriterTest, EndDocumentClosesOpenElements) {
    writer->startElement("a");
    writer->startElement("b");
    writer->writeText("x");
    writer->endDocument();

    EXPECT_EQ(writer->toString(), "<a><b>x</b></a>");
    EXPECT_EQ(writer->getDepth(), 0u);
}

TEST_F(XMLStreamWriterTest, ClearAndReuse) {
    writer->startElement("first");
    writer->clear();
    EXPECT_TRUE(writer->isEmpty());

    writer->writeEmptyElement("second");
    EXPECT_EQ(writer->toString(), "<second />");
}

TEST_F(XMLStreamWriterTest, MisuseThrows) {
    EXPECT_THROW(writer->endElement(), core::OperationException);
    EXPECT_THROW(writer->startElement(""), core::ParameterException);

    writer->startElement("a");
    writer->writeText("t");
    EXPECT_THROW(writer->writeAttribute("late", "1"), core::OperationException);
}

}} // namespace xlbook::xml

#include "xlbook/core/ExceptionBridge.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

namespace xlbook {
namespace core {

TEST(ErrorHandlingTest, FullMessageIncludesContext) {
    Error plain(ErrorCode::WrongPassword, "The password provided does not match");
    EXPECT_EQ(plain.fullMessage(), "The password provided does not match");

    Error with_context(ErrorCode::XmlParseError, "Failed to decode workbook part", "xl/workbook.xml");
    EXPECT_EQ(with_context.fullMessage(), "Failed to decode workbook part (Context: xl/workbook.xml)");
    EXPECT_TRUE(with_context.isError());
    EXPECT_FALSE(Error().isError());
    EXPECT_TRUE(Error().isOk());
}

TEST(ErrorHandlingTest, ValueOrFallsBackOnError) {
    Result<int> ok = 7;
    Result<int> failed = makeError(ErrorCode::WorkbookNotProtected, "Workbook is not protected");
    EXPECT_EQ(ok.valueOr(0), 7);
    EXPECT_EQ(failed.valueOr(-1), -1);
}

TEST(ErrorHandlingTest, ExceptionDetailsCarryContext) {
    XlBookException e("Failed to flush descriptor", ErrorCode::InvalidWorkbook, "Workbook.cpp", 42);
    e.addContext("xl/workbook.xml");
    ASSERT_EQ(e.getContext().size(), 1u);
    EXPECT_EQ(e.getContext()[0], "xl/workbook.xml");

    std::string detailed = e.getDetailedMessage();
    EXPECT_NE(detailed.find("Failed to flush descriptor"), std::string::npos);
    EXPECT_NE(detailed.find("(at Workbook.cpp:42)"), std::string::npos);
    EXPECT_NE(detailed.find("  - xl/workbook.xml"), std::string::npos);

    ParameterException param("Element name cannot be empty", "name");
    EXPECT_EQ(param.getParameterName(), "name");
    EXPECT_EQ(param.getErrorCode(), ErrorCode::InvalidArgument);

    OperationException op("No element to close", "endElement");
    EXPECT_EQ(op.getOperation(), "endElement");

    XMLException xml("Unexpected root", "xl/workbook.xml", 3);
    EXPECT_EQ(xml.getXMLPath(), "xl/workbook.xml");
    EXPECT_EQ(xml.getXMLLine(), 3);
}

TEST(ErrorHandlingTest, UnwrapReturnsValue) {
    Result<int> ok = 42;
    EXPECT_EQ(ExceptionBridge::unwrap(ok), 42);
    VoidResult done = success();
    EXPECT_NO_THROW(ExceptionBridge::unwrap(done));
}

TEST(ErrorHandlingTest, SecurityErrorsBecomeSecurityException) {
    VoidResult wrong = makeError(ErrorCode::WrongPassword, "The password provided does not match");
    try {
        ExceptionBridge::unwrap(wrong);
        FAIL() << "expected SecurityException";
    } catch (const SecurityException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::WrongPassword);
    }

    Result<bool> unsupported = makeError(ErrorCode::UnsupportedHashAlgorithm, "Unsupported hash algorithm: SHA-3");
    EXPECT_THROW(ExceptionBridge::unwrap(unsupported), SecurityException);
}

TEST(ErrorHandlingTest, DecodeErrorsBecomeXmlException) {
    VoidResult decode = makeError(ErrorCode::XmlParseError, "Failed to decode workbook part", "xl/workbook.xml");
    EXPECT_THROW(ExceptionBridge::unwrap(decode), XMLException);
}

TEST(ErrorHandlingTest, FileErrorsBecomeFileException) {
    VoidResult missing = makeError(ErrorCode::FileNotFound, "Failed to open package", "book.xlsx");
    try {
        ExceptionBridge::unwrap(missing);
        FAIL() << "expected FileException";
    } catch (const FileException& e) {
        EXPECT_EQ(e.getErrorCode(), ErrorCode::FileNotFound);
        EXPECT_NE(std::string(e.what()).find("book.xlsx"), std::string::npos);
    }
}

TEST(ErrorHandlingTest, WrapVoidCallCollectsExceptions) {
    auto ok = ExceptionBridge::wrapVoidCall([] {});
    EXPECT_TRUE(ok.hasValue());

    auto typed = ExceptionBridge::wrapVoidCall([] {
        throw SecurityException("locked", ErrorCode::WorkbookNotProtected);
    });
    ASSERT_TRUE(typed.hasError());
    EXPECT_EQ(typed.error().code, ErrorCode::WorkbookNotProtected);

    auto generic = ExceptionBridge::wrapVoidCall([] { throw std::runtime_error("boom"); });
    ASSERT_TRUE(generic.hasError());
    EXPECT_EQ(generic.error().code, ErrorCode::InternalError);
}

}} // namespace xlbook::core

#include "xlbook/opc/NamespaceRegistry.hpp"
#include "xlbook/core/Constants.hpp"
#include <gtest/gtest.h>

namespace xlbook {
namespace opc {

namespace {

const std::string kPart = "xl/workbook.xml";

std::string generatedRoot() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
           "xmlns:relationships=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
           "<sheets><sheet name=\"S\" sheetId=\"1\" relationships:id=\"rId1\" /></sheets></workbook>";
}

} // namespace

// ========== 命名空间登记 ==========

TEST(NamespaceRegistryTest, BoundUriIsNotAddedAgain) {
    NamespaceRegistry registry;
    registry.registerRootAttributes(kPart, {{"xmlns:rel", core::Namespaces::kRelationships}});
    registry.addNameSpaces(kPart, {"xmlns:r", core::Namespaces::kRelationships});

    auto attrs = registry.getRootAttributes(kPart);
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs[0].name, "xmlns:rel");
    EXPECT_EQ(registry.prefixFor(kPart, core::Namespaces::kRelationships, "r"), "rel");
}

TEST(NamespaceRegistryTest, ClashingPrefixGetsNumericSuffix) {
    NamespaceRegistry registry;
    registry.registerRootAttributes(kPart, {{"xmlns:r", "urn:a"}, {"xmlns:r1", "urn:b"}});
    registry.addNameSpaces(kPart, {"xmlns:r", core::Namespaces::kRelationships});

    auto attrs = registry.getRootAttributes(kPart);
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs[2].name, "xmlns:r2");
    EXPECT_EQ(registry.prefixFor(kPart, core::Namespaces::kRelationships, "r"), "r2");
}

TEST(NamespaceRegistryTest, UnknownPartFallsBack) {
    NamespaceRegistry registry;
    EXPECT_FALSE(registry.hasRootAttributes(kPart));
    EXPECT_EQ(registry.prefixFor(kPart, core::Namespaces::kRelationships, "r"), "r");

    registry.registerRootAttributes(kPart, {});
    EXPECT_TRUE(registry.hasRootAttributes(kPart));

    registry.clear();
    EXPECT_FALSE(registry.hasRootAttributes(kPart));
}

// ========== 字节级修正 ==========

TEST(NamespaceRegistryTest, ReplaceNameSpaceBytesUsesRegisteredAttributes) {
    NamespaceRegistry registry;
    registry.registerRootAttributes(kPart, {
        {"xmlns", core::Namespaces::kSpreadsheetML},
        {"xmlns:mc", core::Namespaces::kMarkupCompatibility},
        {"mc:Ignorable", "x15"},
        {"xmlns:x15", "urn:x15?a&b"},
    });
    registry.addNameSpaces(kPart, {"xmlns:r", core::Namespaces::kRelationships});

    std::string out = registry.replaceNameSpaceBytes(kPart, generatedRoot());
    EXPECT_EQ(out.find("xmlns:relationships"), std::string::npos);
    EXPECT_NE(out.find("<workbook xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
                       "xmlns:mc=\"http://schemas.openxmlformats.org/markup-compatibility/2006\" "
                       "mc:Ignorable=\"x15\" xmlns:x15=\"urn:x15?a&amp;b\" "
                       "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\"><sheets>"),
              std::string::npos);
    EXPECT_EQ(out.rfind("<?xml", 0), 0u);
}

TEST(NamespaceRegistryTest, ReplaceNameSpaceBytesKeepsGeneratedDefault) {
    NamespaceRegistry registry;
    registry.registerRootAttributes(kPart, {{"xmlns:r", core::Namespaces::kRelationships}});

    std::string out = registry.replaceNameSpaceBytes(kPart, generatedRoot());
    EXPECT_NE(out.find("xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\""), std::string::npos);
    EXPECT_EQ(out.find("xmlns:relationships"), std::string::npos);
}

TEST(NamespaceRegistryTest, ReplaceRelationshipsBytesRewritesPrefix) {
    std::string out = NamespaceRegistry::replaceRelationshipsBytes(generatedRoot(), "r");
    EXPECT_NE(out.find(" r:id=\"rId1\""), std::string::npos);
    EXPECT_EQ(out.find("relationships:id"), std::string::npos);
    // 命名空间声明本身不受影响
    EXPECT_NE(out.find("xmlns:relationships="), std::string::npos);
}

TEST(NamespaceRegistryTest, StrictNamespacesBecomeTransitional) {
    std::string out = NamespaceRegistry::namespaceStrictToTransitional(
        R"(<workbook xmlns="http://purl.oclc.org/ooxml/spreadsheetml/main" xmlns:r="http://purl.oclc.org/ooxml/officeDocument/relationships"/>)");
    EXPECT_EQ(out,
              R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships"/>)");
}

}} // namespace xlbook::opc

#include "TestPackage.hpp"
#include <gtest/gtest.h>
#include <string>

namespace xlbook {
namespace core {

namespace {

size_t countOccurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

const char* kMinimalWorkbook =
    R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="http://schemas.openxmlformats.org/officeDocument/2006/relationships"><sheets><sheet name="Sheet1" sheetId="1" r:id="rId1"/></sheets></workbook>)";

} // namespace

// ========== 载入 ==========

TEST(WorkbookDescriptorCacheTest, LoadIsIdempotent) {
    test::DescriptorHarness harness(kMinimalWorkbook);
    EXPECT_FALSE(harness.cache.isLoaded());

    auto first = harness.cache.getOrLoad();
    ASSERT_TRUE(first.hasValue());
    EXPECT_TRUE(harness.cache.isLoaded());

    (*first)->sheets.push_back({"Added", 2, "rId2", ""});

    auto second = harness.cache.getOrLoad();
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ((*second)->sheets.size(), 2u);
}

TEST(WorkbookDescriptorCacheTest, MissingPartYieldsEmptyDescriptor) {
    test::DescriptorHarness harness;

    auto descriptor = harness.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_TRUE((*descriptor)->sheets.empty());
    EXPECT_FALSE((*descriptor)->properties.has_value());
    EXPECT_FALSE((*descriptor)->protection.has_value());
}

TEST(WorkbookDescriptorCacheTest, EmptyPartYieldsEmptyDescriptor) {
    test::DescriptorHarness harness;
    harness.store.writePart("xl/workbook.xml", "");

    auto descriptor = harness.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_TRUE((*descriptor)->sheets.empty());
}

TEST(WorkbookDescriptorCacheTest, WhitespaceOnlyPartYieldsEmptyDescriptor) {
    test::DescriptorHarness harness("   \n");

    auto descriptor = harness.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_TRUE((*descriptor)->sheets.empty());
    EXPECT_FALSE((*descriptor)->properties.has_value());
}

TEST(WorkbookDescriptorCacheTest, DeclarationOnlyPartYieldsEmptyDescriptor) {
    test::DescriptorHarness harness("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n<!-- empty -->\n");

    auto descriptor = harness.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_TRUE((*descriptor)->sheets.empty());
    EXPECT_TRUE(harness.namespaces.hasRootAttributes("xl/workbook.xml"));
}

TEST(WorkbookDescriptorCacheTest, DecodesExcelWorkbook) {
    test::DescriptorHarness harness(test::kExcelWorkbookXml);

    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    const WorkbookDescriptor& descriptor = **loaded;

    ASSERT_TRUE(descriptor.file_version.has_value());
    EXPECT_EQ(descriptor.file_version->app_name, "xl");
    EXPECT_EQ(descriptor.file_version->rup_build, "22228");

    ASSERT_EQ(descriptor.sheets.size(), 2u);
    EXPECT_EQ(descriptor.sheets[0].name, "Sheet1");
    EXPECT_EQ(descriptor.sheets[0].sheet_id, 1);
    EXPECT_EQ(descriptor.sheets[0].relationship_id, "rId1");
    EXPECT_EQ(descriptor.sheets[1].name, "Data");
    EXPECT_EQ(descriptor.sheets[1].state, "hidden");
    EXPECT_EQ(descriptor.sheets[1].relationship_id, "rId2");

    ASSERT_EQ(descriptor.defined_names.size(), 1u);
    EXPECT_EQ(descriptor.defined_names[0].name, "_xlnm.Print_Area");
    ASSERT_TRUE(descriptor.defined_names[0].local_sheet_id.has_value());
    EXPECT_EQ(*descriptor.defined_names[0].local_sheet_id, 0);
    EXPECT_EQ(descriptor.defined_names[0].formula, "Sheet1!$A$1:$C$10");

    ASSERT_TRUE(descriptor.properties.has_value());
    EXPECT_FALSE(descriptor.properties->date1904);

    ASSERT_TRUE(descriptor.decode_alternate_content.has_value());
    EXPECT_NE(descriptor.decode_alternate_content->find("x15ac:absPath"), std::string::npos);
    ASSERT_TRUE(descriptor.ext_lst.has_value());
    EXPECT_NE(descriptor.ext_lst->find("chartTrackingRefBase"), std::string::npos);
    EXPECT_EQ(descriptor.book_views.size(), 1u);
    EXPECT_TRUE(descriptor.calc_pr.has_value());
}

TEST(WorkbookDescriptorCacheTest, MalformedPartIsNotCached) {
    test::DescriptorHarness harness("<workbook><sheets>");

    auto failed = harness.cache.getOrLoad();
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code, ErrorCode::XmlParseError);
    EXPECT_EQ(failed.error().context, "xl/workbook.xml");
    EXPECT_FALSE(harness.cache.isLoaded());
    EXPECT_FALSE(harness.namespaces.hasRootAttributes("xl/workbook.xml"));

    // 修复部件后重新尝试
    harness.store.writePart("xl/workbook.xml", kMinimalWorkbook);
    auto retried = harness.cache.getOrLoad();
    ASSERT_TRUE(retried.hasValue());
    EXPECT_EQ((*retried)->sheets.size(), 1u);
}

TEST(WorkbookDescriptorCacheTest, UnexpectedRootIsDecodeError) {
    test::DescriptorHarness harness(R"(<worksheet xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"/>)");

    auto result = harness.cache.getOrLoad();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::XmlParseError);
}

TEST(WorkbookDescriptorCacheTest, ForeignRootNamespaceIsDecodeError) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="urn:not-spreadsheetml"><sheets><sheet name="A" sheetId="1"/></sheets></workbook>)");

    auto result = harness.cache.getOrLoad();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, ErrorCode::XmlParseError);
    EXPECT_FALSE(harness.cache.isLoaded());
    EXPECT_FALSE(harness.namespaces.hasRootAttributes("xl/workbook.xml"));

    // 没有命名空间声明的根元素同样拒绝
    test::DescriptorHarness unbound("<workbook><sheets/></workbook>");
    EXPECT_EQ(unbound.cache.getOrLoad().error().code, ErrorCode::XmlParseError);
}

TEST(WorkbookDescriptorCacheTest, PrefixedRootNamespaceIsAccepted) {
    test::DescriptorHarness harness(
        R"(<x:workbook xmlns:x="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><x:sheets><x:sheet name="A" sheetId="1"/></x:sheets></x:workbook>)");

    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ((*loaded)->sheets.size(), 1u);
    EXPECT_EQ((*loaded)->sheets[0].name, "A");

    test::DescriptorHarness foreign(R"(<x:workbook xmlns:x="urn:not-spreadsheetml"/>)");
    EXPECT_EQ(foreign.cache.getOrLoad().error().code, ErrorCode::XmlParseError);
}

TEST(WorkbookDescriptorCacheTest, RegistersRelationshipsNamespaceOnLoad) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheets/></workbook>)");
    ASSERT_TRUE(harness.cache.getOrLoad().hasValue());

    EXPECT_EQ(harness.namespaces.prefixFor("xl/workbook.xml", Namespaces::kRelationships, "none"), "r");
}

// ========== 写回 ==========

TEST(WorkbookDescriptorCacheTest, FlushWithoutLoadIsNoop) {
    test::DescriptorHarness harness("<workbook/>");

    ASSERT_TRUE(harness.cache.flush().hasValue());
    EXPECT_EQ(harness.workbookXml(), "<workbook/>");
    EXPECT_FALSE(harness.cache.isLoaded());
}

TEST(WorkbookDescriptorCacheTest, RoundTripPreservesRootNamespaces) {
    test::DescriptorHarness harness(test::kExcelWorkbookXml);
    ASSERT_TRUE(harness.cache.getOrLoad().hasValue());
    ASSERT_TRUE(harness.cache.flush().hasValue());

    std::string xml = harness.workbookXml();
    EXPECT_NE(xml.find("mc:Ignorable=\"x15 xr\""), std::string::npos);
    EXPECT_NE(xml.find("xmlns:x15=\"http://schemas.microsoft.com/office/spreadsheetml/2010/11/main\""),
              std::string::npos);
    EXPECT_NE(xml.find("xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""),
              std::string::npos);
    EXPECT_NE(xml.find(" r:id=\"rId1\""), std::string::npos);
    EXPECT_NE(xml.find(" r:id=\"rId2\""), std::string::npos);
    EXPECT_EQ(xml.find("relationships:id"), std::string::npos);
    EXPECT_EQ(xml.find("xmlns:relationships"), std::string::npos);
    EXPECT_EQ(countOccurrences(xml, "<mc:AlternateContent"), 1u);
    EXPECT_NE(xml.find("x15ac:absPath"), std::string::npos);
    EXPECT_NE(xml.find("defaultThemeVersion=\"166925\""), std::string::npos);
    EXPECT_NE(xml.find("chartTrackingRefBase"), std::string::npos);
    EXPECT_NE(xml.find("xr2:uid="), std::string::npos);

    // 写回结果可再次解码
    test::DescriptorHarness reloaded(xml);
    auto descriptor = reloaded.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_EQ((*descriptor)->sheets.size(), 2u);
    EXPECT_EQ((*descriptor)->defined_names.size(), 1u);
}

TEST(WorkbookDescriptorCacheTest, RoundTripPreservesModelFields) {
    test::DescriptorHarness harness(kMinimalWorkbook);
    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());

    WorkbookPr pr;
    pr.date1904 = true;
    pr.filter_privacy = true;
    pr.code_name = "ThisWorkbook";
    (*loaded)->properties = pr;

    WorkbookProtection protection;
    protection.lock_structure = true;
    protection.lock_windows = false;
    protection.algorithm_name = "SHA-512";
    protection.hash_value = "q2Tm3oxDl9w7HxiQ1DFvhGkRR1wXB1uQoTjC5L0P7wE=";
    protection.salt_value = "AAECAwQFBgcICQoLDA0ODw==";
    protection.spin_count = Constants::kWorkbookProtectionSpinCount;
    (*loaded)->protection = protection;

    SheetEntry sheet;
    sheet.name = "Data";
    sheet.sheet_id = 5;
    sheet.relationship_id = "rId9";
    (*loaded)->sheets.push_back(sheet);

    ASSERT_TRUE(harness.cache.flush().hasValue());

    test::DescriptorHarness reloaded(harness.workbookXml());
    auto descriptor = reloaded.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    const WorkbookDescriptor& model = **descriptor;

    ASSERT_TRUE(model.properties.has_value());
    EXPECT_TRUE(model.properties->date1904);
    EXPECT_TRUE(model.properties->filter_privacy);
    EXPECT_EQ(model.properties->code_name, "ThisWorkbook");

    ASSERT_TRUE(model.protection.has_value());
    EXPECT_TRUE(model.protection->lock_structure);
    EXPECT_FALSE(model.protection->lock_windows);
    EXPECT_EQ(model.protection->algorithm_name, protection.algorithm_name);
    EXPECT_EQ(model.protection->hash_value, protection.hash_value);
    EXPECT_EQ(model.protection->salt_value, protection.salt_value);
    EXPECT_EQ(model.protection->spin_count, protection.spin_count);

    ASSERT_EQ(model.sheets.size(), 2u);
    EXPECT_EQ(model.sheets[0].name, "Sheet1");
    EXPECT_EQ(model.sheets[0].sheet_id, 1);
    EXPECT_EQ(model.sheets[0].relationship_id, "rId1");
    EXPECT_EQ(model.sheets[1].name, "Data");
    EXPECT_EQ(model.sheets[1].sheet_id, 5);
    EXPECT_EQ(model.sheets[1].relationship_id, "rId9");
}

TEST(WorkbookDescriptorCacheTest, FlushMovesAlternateContent) {
    test::DescriptorHarness harness(test::kExcelWorkbookXml);
    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_TRUE((*loaded)->decode_alternate_content.has_value());
    const std::string captured = *(*loaded)->decode_alternate_content;

    ASSERT_TRUE(harness.cache.flush().hasValue());

    EXPECT_FALSE((*loaded)->decode_alternate_content.has_value());
    ASSERT_TRUE((*loaded)->alternate_content.has_value());
    EXPECT_EQ((*loaded)->alternate_content->xmlns_mc, Namespaces::kMarkupCompatibility);
    EXPECT_EQ((*loaded)->alternate_content->content, captured);

    // 再次写回不会重复兼容块
    ASSERT_TRUE(harness.cache.flush().hasValue());
    EXPECT_EQ(countOccurrences(harness.workbookXml(), "<mc:AlternateContent"), 1u);
}

TEST(WorkbookDescriptorCacheTest, StrictNamespacesAreConverted) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="http://purl.oclc.org/ooxml/spreadsheetml/main" xmlns:r="http://purl.oclc.org/ooxml/officeDocument/relationships" conformance="strict"><sheets><sheet name="S" sheetId="1" r:id="rId1"/></sheets></workbook>)");

    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ((*loaded)->sheets.size(), 1u);
    EXPECT_EQ((*loaded)->sheets[0].relationship_id, "rId1");

    ASSERT_TRUE(harness.cache.flush().hasValue());
    std::string xml = harness.workbookXml();
    EXPECT_EQ(xml.find("purl.oclc.org"), std::string::npos);
    EXPECT_NE(xml.find("xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\""), std::string::npos);
    EXPECT_NE(xml.find(" r:id=\"rId1\""), std::string::npos);
}

TEST(WorkbookDescriptorCacheTest, CustomRelationshipsPrefixIsPersisted) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:rel="http://schemas.openxmlformats.org/officeDocument/2006/relationships"><sheets><sheet name="S" sheetId="1" rel:id="rId7"/></sheets></workbook>)");

    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ((*loaded)->sheets.size(), 1u);
    EXPECT_EQ((*loaded)->sheets[0].relationship_id, "rId7");

    ASSERT_TRUE(harness.cache.flush().hasValue());
    std::string xml = harness.workbookXml();
    EXPECT_NE(xml.find(" rel:id=\"rId7\""), std::string::npos);
    EXPECT_EQ(xml.find("xmlns:r="), std::string::npos);
    EXPECT_EQ(xml.find("relationships:id"), std::string::npos);
}

TEST(WorkbookDescriptorCacheTest, ClashingPrefixGetsSuffix) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main" xmlns:r="urn:example:other"><sheets/></workbook>)");

    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    (*loaded)->sheets.push_back({"Sheet1", 1, "rId1", ""});

    ASSERT_TRUE(harness.cache.flush().hasValue());
    std::string xml = harness.workbookXml();
    EXPECT_NE(xml.find("xmlns:r=\"urn:example:other\""), std::string::npos);
    EXPECT_NE(xml.find("xmlns:r1=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\""),
              std::string::npos);
    EXPECT_NE(xml.find(" r1:id=\"rId1\""), std::string::npos);
}

TEST(WorkbookDescriptorCacheTest, UnknownElementsArePreserved) {
    test::DescriptorHarness harness(
        R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheets/><calcPr calcId="1"/><oleSize ref="A1:H20"/><futureThing a="1"><child/></futureThing></workbook>)");
    ASSERT_TRUE(harness.cache.getOrLoad().hasValue());
    ASSERT_TRUE(harness.cache.flush().hasValue());

    std::string xml = harness.workbookXml();
    size_t calc = xml.find("<calcPr");
    size_t ole = xml.find("<oleSize ref=\"A1:H20\"");
    size_t future = xml.find("<futureThing a=\"1\"><child/></futureThing>");
    ASSERT_NE(calc, std::string::npos);
    ASSERT_NE(ole, std::string::npos);
    ASSERT_NE(future, std::string::npos);
    EXPECT_LT(calc, ole);
    EXPECT_LT(ole, future);
}

TEST(WorkbookDescriptorCacheTest, UnresolvablePathFailsOnFlush) {
    opc::MemoryPartStore store;
    opc::RelationshipTable relationships(store);
    opc::NamespaceRegistry namespaces;
    WorkbookPathResolver resolver(relationships);
    WorkbookDescriptorCache cache(store, resolver, namespaces);

    auto loaded = cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_TRUE((*loaded)->sheets.empty());

    auto flushed = cache.flush();
    ASSERT_TRUE(flushed.hasError());
    EXPECT_EQ(flushed.error().code, ErrorCode::InvalidWorkbook);
}

TEST(WorkbookDescriptorCacheTest, EscapesTextOnFlush) {
    test::DescriptorHarness harness(kMinimalWorkbook);
    auto loaded = harness.cache.getOrLoad();
    ASSERT_TRUE(loaded.hasValue());
    (*loaded)->sheets[0].name = "R&D \"Q1\"";
    DefinedName defined_name;
    defined_name.name = "Limit";
    defined_name.formula = "IF(A1<5,1,0)";
    (*loaded)->defined_names.push_back(defined_name);

    ASSERT_TRUE(harness.cache.flush().hasValue());
    std::string xml = harness.workbookXml();
    EXPECT_NE(xml.find("name=\"R&amp;D &quot;Q1&quot;\""), std::string::npos);
    EXPECT_NE(xml.find("IF(A1&lt;5,1,0)"), std::string::npos);

    test::DescriptorHarness reloaded(xml);
    auto descriptor = reloaded.cache.getOrLoad();
    ASSERT_TRUE(descriptor.hasValue());
    EXPECT_EQ((*descriptor)->sheets[0].name, "R&D \"Q1\"");
    EXPECT_EQ((*descriptor)->defined_names[0].formula, "IF(A1<5,1,0)");
}

TEST(WorkbookDescriptorCacheTest, ResetDiscardsModel) {
    test::DescriptorHarness harness(kMinimalWorkbook);
    ASSERT_TRUE(harness.cache.getOrLoad().hasValue());
    harness.cache.reset();
    EXPECT_FALSE(harness.cache.isLoaded());
}

}} // namespace xlbook::core

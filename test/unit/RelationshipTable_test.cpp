#include "xlbook/opc/RelationshipTable.hpp"
#include "xlbook/opc/MemoryPartStore.hpp"
#include "xlbook/core/Constants.hpp"
#include <gtest/gtest.h>

namespace xlbook {
namespace opc {

namespace {

const char* kWorkbookRels = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Relationships xmlns="http://schemas.openxmlformats.org/package/2006/relationships">
  <Relationship Id="rId3" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/theme" Target="theme/theme1.xml"/>
  <Relationship Id="rId1" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet" Target="worksheets/sheet1.xml"/>
  <Relationship Id="rId2" Type="http://schemas.openxmlformats.org/officeDocument/2006/relationships/hyperlink" Target="https://example.com/" TargetMode="External"/>
</Relationships>)";

} // namespace

class RelationshipTableTest : public ::testing::Test {
protected:
    MemoryPartStore store_;
    RelationshipTable table_{store_};
};

TEST_F(RelationshipTableTest, MissingPartIsEmpty) {
    EXPECT_TRUE(table_.relationshipsFor("xl/_rels/workbook.xml.rels").empty());

    Relationship rel;
    EXPECT_FALSE(table_.findByType("xl/_rels/workbook.xml.rels", core::Namespaces::kWorksheetRelType, rel));
}

TEST_F(RelationshipTableTest, KeepsDocumentOrder) {
    store_.writePart("xl/_rels/workbook.xml.rels", kWorkbookRels);

    auto rels = table_.relationshipsFor("xl/_rels/workbook.xml.rels");
    ASSERT_EQ(rels.size(), 3u);
    EXPECT_EQ(rels[0].id, "rId3");
    EXPECT_EQ(rels[1].id, "rId1");
    EXPECT_EQ(rels[1].target, "worksheets/sheet1.xml");
    EXPECT_EQ(rels[2].target_mode, "External");
    EXPECT_EQ(rels[0].target_mode, "Internal");
}

TEST_F(RelationshipTableTest, FindByTypeReturnsFirstMatch) {
    store_.writePart("xl/_rels/workbook.xml.rels", kWorkbookRels);

    Relationship rel;
    ASSERT_TRUE(table_.findByType("xl/_rels/workbook.xml.rels", core::Namespaces::kWorksheetRelType, rel));
    EXPECT_EQ(rel.id, "rId1");
}

TEST_F(RelationshipTableTest, MalformedPartIsTreatedAsEmpty) {
    store_.writePart("_rels/.rels", "<Relationships><Relationship");
    EXPECT_TRUE(table_.relationshipsFor("_rels/.rels").empty());
}

TEST_F(RelationshipTableTest, AddAssignsFreeIdAndFlushes) {
    store_.writePart("xl/_rels/workbook.xml.rels", kWorkbookRels);

    Relationship rel;
    rel.type = core::Namespaces::kWorksheetRelType;
    rel.target = "worksheets/sheet2.xml";
    EXPECT_EQ(table_.addRelationship("xl/_rels/workbook.xml.rels", rel), "rId4");

    Relationship explicit_id;
    explicit_id.id = "rId9";
    explicit_id.type = core::Namespaces::kWorksheetRelType;
    explicit_id.target = "worksheets/sheet3.xml";
    EXPECT_EQ(table_.addRelationship("xl/_rels/workbook.xml.rels", explicit_id), "rId9");

    ASSERT_TRUE(table_.flush());

    RelationshipTable reloaded(store_);
    auto rels = reloaded.relationshipsFor("xl/_rels/workbook.xml.rels");
    ASSERT_EQ(rels.size(), 5u);
    EXPECT_EQ(rels[3].id, "rId4");
    EXPECT_EQ(rels[3].target, "worksheets/sheet2.xml");
    EXPECT_EQ(rels[4].id, "rId9");
    EXPECT_EQ(rels[2].target_mode, "External");
}

TEST_F(RelationshipTableTest, AddSkipsTakenIds) {
    Relationship first;
    first.id = "rId2";
    first.type = core::Namespaces::kWorksheetRelType;
    first.target = "a.xml";
    table_.addRelationship("_rels/.rels", first);

    Relationship second;
    second.type = core::Namespaces::kWorksheetRelType;
    second.target = "b.xml";
    EXPECT_EQ(table_.addRelationship("_rels/.rels", second), "rId3");
}

TEST_F(RelationshipTableTest, SerializeOmitsInternalTargetMode) {
    std::vector<Relationship> rels(2);
    rels[0] = {"rId1", core::Namespaces::kOfficeDocumentRelType, "xl/workbook.xml", "Internal"};
    rels[1] = {"rId2", "urn:link", "https://example.com/?a=1&b=2", "External"};

    std::string xml = RelationshipTable::serialize(rels);
    EXPECT_NE(xml.find("<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"),
              std::string::npos);
    EXPECT_NE(xml.find("Target=\"xl/workbook.xml\" />"), std::string::npos);
    EXPECT_NE(xml.find("Target=\"https://example.com/?a=1&amp;b=2\" TargetMode=\"External\""), std::string::npos);
}

TEST_F(RelationshipTableTest, ResetDropsCachedState) {
    EXPECT_TRUE(table_.relationshipsFor("_rels/.rels").empty());
    store_.writePart("_rels/.rels", kWorkbookRels);

    // 已缓存的空结果在 reset 之前保持不变
    EXPECT_TRUE(table_.relationshipsFor("_rels/.rels").empty());
    table_.reset();
    EXPECT_EQ(table_.relationshipsFor("_rels/.rels").size(), 3u);
}

}} // namespace xlbook::opc

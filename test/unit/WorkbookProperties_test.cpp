#include "TestPackage.hpp"
#include "xlbook/core/managers/WorkbookPropertiesManager.hpp"
#include <gtest/gtest.h>
#include <memory>

namespace xlbook {
namespace core {

class WorkbookPropertiesTest : public ::testing::Test {
protected:
    void SetUp() override {
        harness_ = std::make_unique<test::DescriptorHarness>(
            R"(<workbook xmlns="http://schemas.openxmlformats.org/spreadsheetml/2006/main"><sheets/></workbook>)");
        properties_ = std::make_unique<WorkbookPropertiesManager>(harness_->cache);
    }

    std::unique_ptr<test::DescriptorHarness> harness_;
    std::unique_ptr<WorkbookPropertiesManager> properties_;
};

TEST_F(WorkbookPropertiesTest, NullOptionsDoesNotLoad) {
    ASSERT_TRUE(properties_->setProperties(nullptr).hasValue());
    EXPECT_FALSE(harness_->cache.isLoaded());
}

TEST_F(WorkbookPropertiesTest, UnconfiguredWorkbookReportsUnset) {
    auto props = properties_->getProperties();
    ASSERT_TRUE(props.hasValue());
    EXPECT_FALSE(props->date1904.has_value());
    EXPECT_FALSE(props->filter_privacy.has_value());
    EXPECT_FALSE(props->code_name.has_value());
}

TEST_F(WorkbookPropertiesTest, PartialUpdateKeepsOtherFields) {
    WorkbookPropsOptions all;
    all.date1904 = false;
    all.filter_privacy = true;
    all.code_name = "Book";
    ASSERT_TRUE(properties_->setProperties(&all).hasValue());

    WorkbookPropsOptions only_date;
    only_date.date1904 = true;
    ASSERT_TRUE(properties_->setProperties(&only_date).hasValue());

    auto props = properties_->getProperties();
    ASSERT_TRUE(props.hasValue());
    ASSERT_TRUE(props->date1904.has_value());
    EXPECT_TRUE(*props->date1904);
    ASSERT_TRUE(props->filter_privacy.has_value());
    EXPECT_TRUE(*props->filter_privacy);
    ASSERT_TRUE(props->code_name.has_value());
    EXPECT_EQ(*props->code_name, "Book");
}

TEST_F(WorkbookPropertiesTest, ExplicitFalseOverwrites) {
    WorkbookPropsOptions on;
    on.filter_privacy = true;
    ASSERT_TRUE(properties_->setProperties(&on).hasValue());

    WorkbookPropsOptions off;
    off.filter_privacy = false;
    ASSERT_TRUE(properties_->setProperties(&off).hasValue());

    auto props = properties_->getProperties();
    ASSERT_TRUE(props.hasValue());
    ASSERT_TRUE(props->filter_privacy.has_value());
    EXPECT_FALSE(*props->filter_privacy);
}

TEST_F(WorkbookPropertiesTest, EmptyOptionsCreatesRecord) {
    WorkbookPropsOptions none;
    ASSERT_TRUE(properties_->setProperties(&none).hasValue());

    auto props = properties_->getProperties();
    ASSERT_TRUE(props.hasValue());
    ASSERT_TRUE(props->date1904.has_value());
    EXPECT_FALSE(*props->date1904);
    ASSERT_TRUE(props->code_name.has_value());
    EXPECT_TRUE(props->code_name->empty());
}

TEST_F(WorkbookPropertiesTest, FlushWritesOnlySetAttributes) {
    WorkbookPropsOptions options;
    options.date1904 = true;
    options.code_name = "ThisWorkbook";
    ASSERT_TRUE(properties_->setProperties(&options).hasValue());
    ASSERT_TRUE(harness_->cache.flush().hasValue());

    std::string xml = harness_->workbookXml();
    EXPECT_NE(xml.find("<workbookPr date1904=\"1\" codeName=\"ThisWorkbook\""), std::string::npos);
    EXPECT_EQ(xml.find("filterPrivacy"), std::string::npos);

    test::DescriptorHarness reloaded(xml);
    WorkbookPropertiesManager manager(reloaded.cache);
    auto props = manager.getProperties();
    ASSERT_TRUE(props.hasValue());
    EXPECT_TRUE(*props->date1904);
    EXPECT_FALSE(*props->filter_privacy);
    EXPECT_EQ(*props->code_name, "ThisWorkbook");
}

TEST_F(WorkbookPropertiesTest, UnmodelledAttributesSurvive) {
    test::DescriptorHarness harness(test::kExcelWorkbookXml);
    WorkbookPropertiesManager manager(harness.cache);

    WorkbookPropsOptions options;
    options.filter_privacy = true;
    ASSERT_TRUE(manager.setProperties(&options).hasValue());
    ASSERT_TRUE(harness.cache.flush().hasValue());

    std::string xml = harness.workbookXml();
    EXPECT_NE(xml.find("filterPrivacy=\"1\""), std::string::npos);
    EXPECT_NE(xml.find("defaultThemeVersion=\"166925\""), std::string::npos);
}

TEST_F(WorkbookPropertiesTest, LoadFailurePropagates) {
    test::DescriptorHarness harness("<workbook");
    WorkbookPropertiesManager manager(harness.cache);

    WorkbookPropsOptions options;
    options.date1904 = true;
    auto set = manager.setProperties(&options);
    ASSERT_TRUE(set.hasError());
    EXPECT_EQ(set.error().code, ErrorCode::XmlParseError);

    auto get = manager.getProperties();
    ASSERT_TRUE(get.hasError());
    EXPECT_EQ(get.error().code, ErrorCode::XmlParseError);
}

}} // namespace xlbook::core

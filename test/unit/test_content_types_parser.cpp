#include "fastword/core/Constants.hpp"
#include "fastword/reader/ContentTypesParser.hpp"
#include "fastword/utils/Logger.hpp"

#include <gtest/gtest.h>

namespace fastword {
namespace reader {

class ContentTypesParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastword::Logger::getInstance().initialize("logs/test_content_types_parser.log",
                                                   fastword::Logger::Level::DEBUG,
                                                   false);
        ASSERT_TRUE(parser_.parse(content_types_));
    }

    void TearDown() override {
        fastword::Logger::getInstance().shutdown();
    }

    ContentTypesParser parser_;

    const std::string content_types_ = R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>
<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">
  <Default Extension="rels" ContentType="application/vnd.openxmlformats-package.relationships+xml"/>
  <Default Extension="xml" ContentType="application/xml"/>
  <Default Extension="PNG" ContentType="image/png"/>
  <Override PartName="/word/document.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml"/>
  <Override PartName="/word/styles.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml"/>
  <Override PartName="/word/Header1.xml" ContentType="application/vnd.openxmlformats-officedocument.wordprocessingml.header+xml"/>
</Types>)";
};

TEST_F(ContentTypesParserTest, Counts) {
    EXPECT_EQ(parser_.getDefaultCount(), 3u);
    EXPECT_EQ(parser_.getOverrideCount(), 3u);
    EXPECT_EQ(parser_.getOverrides()[0].part_name, "/word/document.xml");
}

TEST_F(ContentTypesParserTest, OverrideWinsOverDefault) {
    EXPECT_EQ(parser_.getContentType("/word/document.xml"), core::Constants::kMainContentType);
    EXPECT_EQ(parser_.getContentType("/word/styles.xml"), core::Constants::kStylesContentType);
    EXPECT_EQ(parser_.getContentType("/word/settings.xml"), "application/xml");
}

TEST_F(ContentTypesParserTest, CaseInsensitiveLookup) {
    EXPECT_EQ(parser_.getContentType("/word/header1.xml"), core::Constants::kHeaderContentType);
    EXPECT_EQ(parser_.getContentType("/word/media/image1.png"), "image/png");
    EXPECT_EQ(parser_.findDefaultType("Rels"), core::Constants::kRelationshipsContentType);
}

TEST_F(ContentTypesParserTest, LeadingSlashIsOptional) {
    EXPECT_EQ(parser_.findOverrideType("word/document.xml"), core::Constants::kMainContentType);
    EXPECT_EQ(parser_.findOverrideType("/word/document.xml"), core::Constants::kMainContentType);
}

TEST_F(ContentTypesParserTest, UnknownFallsBackToOctetStream) {
    EXPECT_EQ(parser_.getContentType("/word/embeddings/oleObject1.bin"), core::Constants::kOctetStreamContentType);
    EXPECT_EQ(parser_.getContentType("/word.d/noextension"), core::Constants::kOctetStreamContentType);
    EXPECT_TRUE(parser_.findOverrideType("/word/missing.xml").empty());
}

}} // namespace fastword::reader

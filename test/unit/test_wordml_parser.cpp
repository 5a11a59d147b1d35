#include "DocxTestUtils.hpp"
#include "fastword/utils/Logger.hpp"

#include <gtest/gtest.h>

namespace fastword {
namespace reader {

class WordMLParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastword::Logger::getInstance().initialize("logs/test_wordml_parser.log",
                                                   fastword::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        fastword::Logger::getInstance().shutdown();
    }

    WordMLParser parser_;
};

TEST_F(WordMLParserTest, RootElementNames) {
    EXPECT_STREQ(WordMLParser::rootElementName(SchemaKind::Document), "document");
    EXPECT_STREQ(WordMLParser::rootElementName(SchemaKind::Styles), "styles");
    EXPECT_STREQ(WordMLParser::rootElementName(SchemaKind::Comments), "comments");
    EXPECT_STREQ(WordMLParser::rootElementName(SchemaKind::Header), "hdr");
    EXPECT_STREQ(WordMLParser::rootElementName(SchemaKind::Footer), "ftr");
}

TEST_F(WordMLParserTest, ParsesEachSchema) {
    struct Case {
        SchemaKind kind;
        std::string root;
    };
    const Case cases[] = {
        {SchemaKind::Document, "document"},
        {SchemaKind::Styles, "styles"},
        {SchemaKind::Comments, "comments"},
        {SchemaKind::Header, "hdr"},
        {SchemaKind::Footer, "ftr"},
    };

    for (const auto& c : cases) {
        auto result = parser_.parse(test::wordPart(c.root, test::paragraphXml("x")), c.kind);
        ASSERT_TRUE(result) << toString(c.kind) << ": " << result.error().message;
        EXPECT_TRUE(result.value()->is(core::Constants::kWordprocessingNS, c.root));
    }
}

TEST_F(WordMLParserTest, SchemaMismatch) {
    auto result = parser_.parse(test::stylesXml(""), SchemaKind::Document);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::SchemaMismatch);
}

TEST_F(WordMLParserTest, RootInWrongNamespace) {
    auto result = parser_.parse("<document xmlns=\"urn:other\"><body/></document>", SchemaKind::Document);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, core::ErrorCode::SchemaMismatch);
}

TEST_F(WordMLParserTest, MalformedAndEmptyInput) {
    auto malformed = parser_.parse("<w:document xmlns:w=\"x\"><w:body>", SchemaKind::Document);
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().code, core::ErrorCode::XmlParseError);

    auto empty = parser_.parse("", SchemaKind::Styles);
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, core::ErrorCode::XmlParseError);
}

TEST_F(WordMLParserTest, PreservesSignificantSpaces) {
    auto result = parser_.parse(test::documentXml(test::paragraphXml("  two  spaces ")), SchemaKind::Document);
    ASSERT_TRUE(result);

    const xml::XMLElement* t = result.value()
        ->findChild(core::Constants::kWordprocessingNS, "body")
        ->findChild(core::Constants::kWordprocessingNS, "p")
        ->findChild(core::Constants::kWordprocessingNS, "r")
        ->findChild(core::Constants::kWordprocessingNS, "t");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->text, "  two  spaces ");
}

TEST_F(WordMLParserTest, UsableThroughInterface) {
    std::shared_ptr<const IStructuralParser> parser = std::make_shared<WordMLParser>();
    auto result = parser->parse(test::wordPart("hdr", ""), SchemaKind::Header);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value()->hasChildren());
}

}} // namespace fastword::reader

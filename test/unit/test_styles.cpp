#include "DocxTestUtils.hpp"
#include "fastword/core/Styles.hpp"
#include "fastword/utils/Logger.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace fastword {
namespace core {

class StylesTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastword::Logger::getInstance().initialize("logs/test_styles.log",
                                                   fastword::Logger::Level::DEBUG,
                                                   false);
    }

    void TearDown() override {
        fastword::Logger::getInstance().shutdown();
    }

    static std::unique_ptr<Styles> load(const std::string& inner) {
        reader::WordMLParser parser;
        auto root = parser.parse(test::stylesXml(inner), reader::SchemaKind::Styles);
        if (!root) {
            ADD_FAILURE() << root.error().message;
            return nullptr;
        }
        return std::make_unique<Styles>(std::move(root).value());
    }

    const std::string sample_ =
        "<w:docDefaults/>"
        "<w:style w:type=\"paragraph\" w:default=\"1\" w:styleId=\"Normal\">"
        "  <w:name w:val=\"Normal\"/><w:next w:val=\"Normal\"/></w:style>"
        "<w:style w:type=\"character\" w:default=\"1\" w:styleId=\"DefaultParagraphFont\">"
        "  <w:name w:val=\"Default Paragraph Font\"/></w:style>"
        "<w:style w:type=\"paragraph\" w:styleId=\"Heading1\">"
        "  <w:name w:val=\"heading 1\"/><w:basedOn w:val=\"Normal\"/><w:next w:val=\"BodyText\"/>"
        "  <w:link w:val=\"Heading1Char\"/></w:style>"
        "<w:style w:type=\"character\" w:customStyle=\"1\" w:styleId=\"Heading1Char\">"
        "  <w:name w:val=\"Heading 1 Char\"/><w:basedOn w:val=\"DefaultParagraphFont\"/></w:style>"
        "<w:style w:type=\"paragraph\" w:styleId=\"BodyText\"><w:basedOn w:val=\"Normal\"/></w:style>"
        "<w:style w:styleId=\"Untyped\"/>";
};

TEST_F(StylesTest, ParsesStyleDefinitions) {
    auto styles = load(sample_);
    ASSERT_NE(styles, nullptr);
    EXPECT_EQ(styles->getStyleCount(), 6u);
    EXPECT_EQ(styles->getStyles()[0].id, "Normal");

    const Style* heading = styles->getStyle("Heading1");
    ASSERT_NE(heading, nullptr);
    EXPECT_EQ(heading->type, "paragraph");
    EXPECT_EQ(heading->name, "heading 1");
    EXPECT_EQ(heading->based_on, "Normal");
    EXPECT_EQ(heading->next, "BodyText");
    EXPECT_EQ(heading->link, "Heading1Char");
    EXPECT_FALSE(heading->is_default);

    const Style* heading_char = styles->getStyle("Heading1Char");
    ASSERT_NE(heading_char, nullptr);
    EXPECT_EQ(heading_char->type, "character");
    EXPECT_TRUE(heading_char->is_custom);

    // 缺省类型为 paragraph
    EXPECT_EQ(styles->getStyle("Untyped")->type, "paragraph");
    EXPECT_FALSE(styles->styleExist("Missing"));
}

TEST_F(StylesTest, DefaultStylePerType) {
    auto styles = load(sample_);
    ASSERT_NE(styles, nullptr);
    EXPECT_EQ(styles->getDefaultStyleId("paragraph"), "Normal");
    EXPECT_EQ(styles->getDefaultStyleId("character"), "DefaultParagraphFont");
    EXPECT_EQ(styles->getDefaultStyleId("table"), "");
}

TEST_F(StylesTest, StyleChainFollowsBasedOn) {
    auto styles = load(sample_);
    ASSERT_NE(styles, nullptr);

    auto chain = styles->getStyleChain("Heading1Char");
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[0]->id, "Heading1Char");
    EXPECT_EQ(chain[1]->id, "DefaultParagraphFont");

    EXPECT_TRUE(styles->getStyleChain("Missing").empty());
}

TEST_F(StylesTest, StyleChainStopsOnCycle) {
    auto styles = load(
        "<w:style w:styleId=\"A\"><w:basedOn w:val=\"B\"/></w:style>"
        "<w:style w:styleId=\"B\"><w:basedOn w:val=\"A\"/></w:style>");
    ASSERT_NE(styles, nullptr);

    auto chain = styles->getStyleChain("A");
    ASSERT_EQ(chain.size(), 2u);
    EXPECT_EQ(chain[1]->id, "B");
}

TEST_F(StylesTest, UsedStyleListCollectsReferences) {
    auto styles = load(sample_);
    ASSERT_NE(styles, nullptr);

    auto used = styles->getUsedStyleList("Heading1");
    std::vector<std::string> ids;
    for (const Style* style : used) {
        ids.push_back(style->id);
    }
    std::sort(ids.begin(), ids.end());
    std::vector<std::string> expected = {"BodyText", "DefaultParagraphFont", "Heading1", "Heading1Char", "Normal"};
    EXPECT_EQ(ids, expected);
}

TEST_F(StylesTest, DuplicateAndAnonymousStyles) {
    auto styles = load(
        "<w:style w:type=\"paragraph\"><w:name w:val=\"no id\"/></w:style>"
        "<w:style w:styleId=\"Dup\"><w:name w:val=\"first\"/></w:style>"
        "<w:style w:styleId=\"Dup\"><w:name w:val=\"second\"/></w:style>");
    ASSERT_NE(styles, nullptr);

    EXPECT_EQ(styles->getStyleCount(), 1u);
    EXPECT_EQ(styles->getStyle("Dup")->name, "first");
}

TEST_F(StylesTest, LookupByName) {
    auto styles = load(sample_);
    ASSERT_NE(styles, nullptr);
    EXPECT_EQ(styles->getStyleIdByName("heading 1"), "Heading1");
    EXPECT_EQ(styles->getStyleIdByName("nonexistent"), "");
}

}} // namespace fastword::core

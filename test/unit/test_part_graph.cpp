#include "DocxTestUtils.hpp"
#include "fastword/utils/Logger.hpp"

#include <gtest/gtest.h>

namespace fastword {
namespace opc {

class PartGraphTest : public ::testing::Test {
protected:
    using Relationship = PartGraph::Relationship;

    void SetUp() override {
        fastword::Logger::getInstance().initialize("logs/test_part_graph.log",
                                                   fastword::Logger::Level::DEBUG,
                                                   false);
        graph_.addPart("word/document.xml", core::Constants::kMainContentType, "<doc/>");
        graph_.addPart("word/media/image1.png", "image/png", "PNG");
        graph_.addPart("media/shared.png", "image/png", "PNG");
        graph_.addPart("word/my image.png", "image/png", "PNG");
    }

    void TearDown() override {
        fastword::Logger::getInstance().shutdown();
    }

    PartGraph graph_;
};

TEST_F(PartGraphTest, NormalizePathRelativeToSource) {
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "styles.xml"), "word/styles.xml");
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "media/image1.png"), "word/media/image1.png");
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "../media/x.png"), "media/x.png");
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "./theme/../styles.xml"), "word/styles.xml");
    EXPECT_EQ(PartGraph::normalizePath("", "word/document.xml"), "word/document.xml");
}

TEST_F(PartGraphTest, NormalizePathAbsoluteFragmentAndEscapes) {
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "/customXml/item1.xml"), "customXml/item1.xml");
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "footnotes.xml#anchor"), "word/footnotes.xml");
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "my%20image.png"), "word/my%20image.png");
    // 越过包根的 .. 被忽略
    EXPECT_EQ(PartGraph::normalizePath("word/document.xml", "../../../x.xml"), "x.xml");
}

TEST_F(PartGraphTest, RelsPathMapping) {
    EXPECT_EQ(PartGraph::getRelsPath("word/document.xml"), "word/_rels/document.xml.rels");
    EXPECT_EQ(PartGraph::getRelsPath(""), core::Constants::kPackageRelsPath);
    EXPECT_EQ(PartGraph::getRelsPath("root.xml"), "_rels/root.xml.rels");

    EXPECT_EQ(PartGraph::getSourcePartFromRelsPath("word/_rels/document.xml.rels"), "word/document.xml");
    EXPECT_EQ(PartGraph::getSourcePartFromRelsPath("_rels/.rels"), PartGraph::kPackageSource);
    EXPECT_EQ(PartGraph::getSourcePartFromRelsPath("word/document.xml"), "word/document.xml");

    EXPECT_TRUE(PartGraph::isRelsPath("word/_rels/document.xml.rels"));
    EXPECT_FALSE(PartGraph::isRelsPath("word/document.xml"));
    EXPECT_FALSE(PartGraph::isRelsPath("word/custom.rels"));
}

TEST_F(PartGraphTest, PartsKeepInsertionOrder) {
    ASSERT_EQ(graph_.getPartCount(), 4u);
    EXPECT_EQ(graph_.getAllParts()[0], "word/document.xml");
    EXPECT_EQ(graph_.getAllParts()[3], "word/my image.png");

    // 重复添加只替换内容
    graph_.addPart("word/media/image1.png", "image/png", "NEW");
    EXPECT_EQ(graph_.getPartCount(), 4u);
    EXPECT_EQ(graph_.getPart("word/media/image1.png")->data, "NEW");
    EXPECT_FALSE(graph_.hasPart("/word/document.xml"));
}

TEST_F(PartGraphTest, AddRelationshipValidation) {
    EXPECT_TRUE(graph_.addRelationship("word/document.xml",
                                       Relationship("rId1", core::Constants::kHyperlinkRelType, "https://a", "External")));

    auto duplicate = graph_.addRelationship("word/document.xml",
                                            Relationship("rId1", core::Constants::kHyperlinkRelType, "https://b"));
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, core::ErrorCode::DuplicateId);

    auto orphan = graph_.addRelationship("word/missing.xml",
                                         Relationship("rId1", core::Constants::kStylesRelType, "styles.xml"));
    ASSERT_FALSE(orphan);
    EXPECT_EQ(orphan.error().code, core::ErrorCode::PartNotFound);

    // 包级关系不需要源部件
    EXPECT_TRUE(graph_.addRelationship(PartGraph::kPackageSource,
                                       Relationship("rId1", core::Constants::kOfficeDocumentRelType, "word/document.xml")));
}

TEST_F(PartGraphTest, RelationshipQueries) {
    const std::string source = "word/document.xml";
    ASSERT_TRUE(graph_.addRelationship(source, Relationship("rId5", core::Constants::kPackageRelType, "media/image1.png")));
    ASSERT_TRUE(graph_.addRelationship(source, Relationship("rId2", core::Constants::kOleObjectRelType, "../media/shared.png")));
    ASSERT_TRUE(graph_.addRelationship(source, Relationship("rId3", core::Constants::kPackageRelType, "my%20image.png")));

    EXPECT_EQ(graph_.getRelationships(source).size(), 3u);
    EXPECT_TRUE(graph_.getRelationships("word/media/image1.png").empty());
    EXPECT_TRUE(graph_.getRelationships("no/such/part.xml").empty());

    auto packages = graph_.getRelationshipsByType(source, core::Constants::kPackageRelType);
    ASSERT_EQ(packages.size(), 2u);
    EXPECT_EQ(packages[0]->id, "rId5");
    EXPECT_EQ(packages[1]->id, "rId3");

    const Relationship* rel = graph_.getRelationship(source, "rId2");
    ASSERT_NE(rel, nullptr);
    EXPECT_EQ(rel->target, "../media/shared.png");
    EXPECT_EQ(graph_.getRelationship(source, "rId404"), nullptr);
}

TEST_F(PartGraphTest, ResolveTargetPart) {
    const std::string source = "word/document.xml";

    auto image = graph_.resolveTargetPart(source, Relationship("rId1", core::Constants::kPackageRelType, "media/image1.png"));
    ASSERT_TRUE(image);
    EXPECT_EQ(image.value()->path, "word/media/image1.png");

    auto shared = graph_.resolveTargetPart(source, Relationship("rId2", core::Constants::kOleObjectRelType, "../media/shared.png"));
    ASSERT_TRUE(shared);
    EXPECT_EQ(shared.value()->path, "media/shared.png");

    auto missing = graph_.resolveTargetPart(source, Relationship("rId3", core::Constants::kStylesRelType, "styles.xml"));
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, core::ErrorCode::PartNotFound);
    EXPECT_EQ(missing.error().context, "word/styles.xml");

    auto external = graph_.resolveTargetPart(source, Relationship("rId4", core::Constants::kHyperlinkRelType,
                                                                  "https://example.com", "External"));
    ASSERT_FALSE(external);
    EXPECT_EQ(external.error().code, core::ErrorCode::PartNotFound);

    auto empty = graph_.resolveTargetPart(source, Relationship("rId5", core::Constants::kStylesRelType, ""));
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, core::ErrorCode::InvalidTargetUri);
}

TEST_F(PartGraphTest, ResolveTargetPartMatchesEncodedName) {
    const std::string source = "word/document.xml";
    graph_.addPart("word/media/my%20photo.png", "image/png", "PNG");

    auto encoded = graph_.resolveTargetPart(source, Relationship("rId1", core::Constants::kPackageRelType,
                                                                 "media/my%20photo.png"));
    ASSERT_TRUE(encoded);
    EXPECT_EQ(encoded.value()->path, "word/media/my%20photo.png");

    // 条目名为解码形式时回退匹配
    auto decoded = graph_.resolveTargetPart(source, Relationship("rId2", core::Constants::kPackageRelType,
                                                                 "my%20image.png"));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value()->path, "word/my image.png");
}

TEST_F(PartGraphTest, ResolveTargetUriKeepsEncoding) {
    const std::string source = "word/document.xml";

    auto internal = graph_.resolveTargetUri(source, Relationship("rId1", core::Constants::kHyperlinkRelType,
                                                                 "my%20doc.docx"));
    ASSERT_TRUE(internal);
    EXPECT_EQ(internal.value(), "/word/my%20doc.docx");
    EXPECT_EQ(internal.value().find(' '), std::string::npos);
}

TEST_F(PartGraphTest, ResolveTargetUri) {
    const std::string source = "word/document.xml";

    auto external = graph_.resolveTargetUri(source, Relationship("rId1", core::Constants::kHyperlinkRelType,
                                                                 "https://example.com/a?b=c#frag", "External"));
    ASSERT_TRUE(external);
    EXPECT_EQ(external.value(), "https://example.com/a?b=c#frag");

    auto internal = graph_.resolveTargetUri(source, Relationship("rId2", core::Constants::kHyperlinkRelType,
                                                                 "../media/x.png"));
    ASSERT_TRUE(internal);
    EXPECT_EQ(internal.value(), "/media/x.png");

    auto invalid = graph_.resolveTargetUri(source, Relationship("rId3", core::Constants::kHyperlinkRelType,
                                                                "http://bad host/", "External"));
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, core::ErrorCode::InvalidTargetUri);

    auto empty = graph_.resolveTargetUri(source, Relationship("rId4", core::Constants::kHyperlinkRelType, "", "External"));
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, core::ErrorCode::InvalidTargetUri);
}

TEST_F(PartGraphTest, MainDocumentPart) {
    auto none = graph_.getMainDocumentPart();
    ASSERT_FALSE(none);
    EXPECT_EQ(none.error().code, core::ErrorCode::InvalidPackage);

    ASSERT_TRUE(graph_.addRelationship(PartGraph::kPackageSource,
                                       Relationship("rId1", core::Constants::kOfficeDocumentRelType, "word/document.xml")));
    auto main_part = graph_.getMainDocumentPart();
    ASSERT_TRUE(main_part);
    EXPECT_EQ(main_part.value()->path, "word/document.xml");
}

TEST_F(PartGraphTest, MainDocumentPartMissingTarget) {
    ASSERT_TRUE(graph_.addRelationship(PartGraph::kPackageSource,
                                       Relationship("rId1", core::Constants::kOfficeDocumentRelType, "word/main.xml")));
    auto main_part = graph_.getMainDocumentPart();
    ASSERT_FALSE(main_part);
    EXPECT_EQ(main_part.error().code, core::ErrorCode::InvalidPackage);
}

}} // namespace fastword::opc

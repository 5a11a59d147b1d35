#include "DocxTestUtils.hpp"
#include "fastword/utils/Logger.hpp"

#include <gtest/gtest.h>

namespace fastword {
namespace core {

using test::PackageBuilder;
using test::paragraphXml;
using test::tableXml;

class DocumentAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fastword::Logger::getInstance().initialize("logs/test_document_assembler.log",
                                                   fastword::Logger::Level::DEBUG,
                                                   false);
        strict_.policy = AssemblyPolicy::Strict;
    }

    void TearDown() override {
        fastword::Logger::getInstance().shutdown();
    }

    static std::unique_ptr<Document> assembleOk(const PackageBuilder& builder,
                                                const DocumentOptions& options = DocumentOptions()) {
        auto result = builder.assemble(options);
        if (!result) {
            ADD_FAILURE() << "Assembly failed: " << result.error().fullMessage();
            return nullptr;
        }
        return std::move(result).value();
    }

    DocumentOptions strict_;
};

// ========== 正文 ==========

TEST_F(DocumentAssemblerTest, BodyOrderIsPreserved) {
    PackageBuilder builder(paragraphXml("first") + paragraphXml("second") + tableXml(2, 2) +
                           "<w:bookmarkStart w:id=\"0\" w:name=\"x\"/>" + paragraphXml("last") +
                           "<w:sectPr/>");
    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    const auto& body = document->getBodyElements();
    ASSERT_EQ(body.size(), 4u);
    EXPECT_EQ(body[0]->getElementType(), BodyElementType::Paragraph);
    EXPECT_EQ(body[1]->getElementType(), BodyElementType::Paragraph);
    EXPECT_EQ(body[2]->getElementType(), BodyElementType::Table);
    EXPECT_EQ(body[3]->getElementType(), BodyElementType::Paragraph);

    EXPECT_EQ(body[0]->getText(), "first");
    EXPECT_EQ(body[3]->getText(), "last");
    EXPECT_EQ(body[2]->getDocument(), document.get());

    EXPECT_EQ(document->getParagraphs().size(), 3u);
    ASSERT_EQ(document->getTables().size(), 1u);
    EXPECT_EQ(document->getTables()[0]->getCellText(1, 0), "R1C0");
    EXPECT_EQ(document->getText(), "first\nsecond\nR0C0\tR0C1\nR1C0\tR1C1\nlast");
    EXPECT_EQ(document->getDocumentBody().local_name, "body");
    EXPECT_EQ(document->getCorePartPath(), "word/document.xml");
}

TEST_F(DocumentAssemblerTest, ParagraphTextHandlesTabsBreaksAndDeletions) {
    PackageBuilder builder(
        "<w:p><w:pPr><w:pStyle w:val=\"Heading1\"/></w:pPr>"
        "<w:r><w:t>a</w:t><w:tab/><w:t>b</w:t><w:br/><w:t>c</w:t></w:r>"
        "<w:del><w:r><w:delText>gone</w:delText></w:r></w:del>"
        "<w:ins><w:r><w:t>d</w:t></w:r></w:ins></w:p>");
    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    auto paragraphs = document->getParagraphs();
    ASSERT_EQ(paragraphs.size(), 1u);
    EXPECT_EQ(paragraphs[0]->getText(), "a\tb\ncd");
    EXPECT_EQ(paragraphs[0]->getStyleId(), "Heading1");
    EXPECT_FALSE(paragraphs[0]->isEmpty());
}

TEST_F(DocumentAssemblerTest, EmptyBody) {
    PackageBuilder builder("");
    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    EXPECT_TRUE(document->getBodyElements().empty());
    EXPECT_TRUE(document->getText().empty());
    EXPECT_TRUE(document->getDiagnostics().empty());
}

// ========== 主文档错误 ==========

TEST_F(DocumentAssemblerTest, MalformedRootXml) {
    PackageBuilder builder;
    builder.setMainDocumentData("<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\"><w:body>");

    auto result = builder.assemble();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRootPart);
    EXPECT_EQ(result.error().context, "word/document.xml");
}

TEST_F(DocumentAssemblerTest, RootWithoutBody) {
    PackageBuilder builder;
    builder.setMainDocumentData(test::wordPart("document", ""));

    auto result = builder.assemble();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRootPart);
}

TEST_F(DocumentAssemblerTest, RootWithWrongSchema) {
    PackageBuilder builder;
    builder.setMainDocumentData(test::stylesXml(""));

    auto result = builder.assemble();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MalformedRootPart);
}

TEST_F(DocumentAssemblerTest, PackageWithoutMainDocument) {
    auto graph = std::make_shared<opc::PartGraph>();
    graph->addPart("word/document.xml", Constants::kMainContentType, test::documentXml(""));

    DocumentAssembler assembler;
    auto result = assembler.assembleFromPackage(graph);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPackage);

    auto null_graph = assembler.assembleFromPackage(nullptr);
    ASSERT_FALSE(null_graph);
    EXPECT_EQ(null_graph.error().code, ErrorCode::InvalidArgument);
}

TEST_F(DocumentAssemblerTest, AssembleExplicitRootPart) {
    PackageBuilder builder;
    builder.addPart("word/alt.xml", Constants::kMainContentType, test::documentXml(paragraphXml("alt")));

    DocumentAssembler assembler;
    auto result = assembler.assemble("word/alt.xml", builder.graph());
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value()->getCorePartPath(), "word/alt.xml");
    EXPECT_EQ(result.value()->getText(), "alt");

    auto missing = assembler.assemble("word/none.xml", builder.graph());
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::PartNotFound);
}

// ========== 超链接 ==========

TEST_F(DocumentAssemblerTest, HyperlinksWithSameTargetStayDistinct) {
    PackageBuilder builder;
    builder.addRelationship("rId1", Constants::kHyperlinkRelType, "https://example.com/", "External")
           .addRelationship("rId2", Constants::kHyperlinkRelType, "https://example.com/", "External");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    const auto& hyperlinks = document->getHyperlinks();
    ASSERT_EQ(hyperlinks.size(), 2u);
    EXPECT_EQ(hyperlinks[0].getId(), "rId1");
    EXPECT_EQ(hyperlinks[1].getId(), "rId2");
    EXPECT_NE(hyperlinks[0], hyperlinks[1]);
    EXPECT_EQ(hyperlinks[0].getURL(), hyperlinks[1].getURL());

    const Hyperlink* first = document->findHyperlink("rId1");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, &hyperlinks[0]);
    EXPECT_EQ(first->getURL(), "https://example.com/");
    EXPECT_EQ(document->findHyperlink("rId3"), nullptr);
}

TEST_F(DocumentAssemblerTest, InternalHyperlinkResolvesToAbsoluteUri) {
    PackageBuilder builder;
    builder.addRelationship("rId1", Constants::kHyperlinkRelType, "../docs/readme.txt");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    ASSERT_NE(document->findHyperlink("rId1"), nullptr);
    EXPECT_EQ(document->findHyperlink("rId1")->getURL(), "/docs/readme.txt");
}

TEST_F(DocumentAssemblerTest, InternalHyperlinkKeepsPercentEncoding) {
    PackageBuilder builder;
    builder.addRelationship("rId1", Constants::kHyperlinkRelType, "my%20doc.docx");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    const Hyperlink* link = document->findHyperlink("rId1");
    ASSERT_NE(link, nullptr);
    EXPECT_FALSE(link->getError().has_value());
    EXPECT_EQ(link->getURL(), "/word/my%20doc.docx");
    EXPECT_TRUE(document->getDiagnostics().empty());
}

TEST_F(DocumentAssemblerTest, UnresolvableHyperlinkIsPerItemFailure) {
    PackageBuilder builder;
    builder.addRelationship("rId1", Constants::kHyperlinkRelType, "https://ok.example/", "External")
           .addRelationship("rId2", Constants::kHyperlinkRelType, "not a uri", "External");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    ASSERT_EQ(document->getHyperlinks().size(), 2u);

    const Hyperlink* broken = document->findHyperlink("rId2");
    ASSERT_NE(broken, nullptr);
    EXPECT_FALSE(broken->isResolved());
    EXPECT_TRUE(broken->getURL().empty());
    ASSERT_TRUE(broken->getError().has_value());
    EXPECT_EQ(broken->getError()->code, ErrorCode::InvalidTargetUri);

    ASSERT_EQ(document->getDiagnostics().size(), 1u);
    EXPECT_EQ(document->getDiagnostics()[0].code, ErrorCode::PerItemResolutionFailure);
    EXPECT_EQ(document->getDiagnostics()[0].item, "hyperlink");
    EXPECT_EQ(document->getDiagnostics()[0].relationship_id, "rId2");

    auto strict = builder.assemble(strict_);
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, ErrorCode::PerItemResolutionFailure);
    EXPECT_EQ(strict.error().context, "rId2");
}

// ========== 批注 ==========

TEST_F(DocumentAssemblerTest, NoCommentsRelationship) {
    PackageBuilder builder;
    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    EXPECT_TRUE(document->getComments().empty());
    EXPECT_EQ(document->findComment("0"), nullptr);
    EXPECT_EQ(document->findComment(""), nullptr);
}

TEST_F(DocumentAssemblerTest, CommentsIndexedByOwnId) {
    PackageBuilder builder;
    builder.addComments("rId4", "comments.xml",
                        test::commentXml("7", "Alice", "first note") + test::commentXml("3", "Bob", "second note"));

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    auto comments = document->getComments();
    ASSERT_EQ(comments.size(), 2u);
    EXPECT_EQ(comments[0]->getId(), "7");
    EXPECT_EQ(comments[1]->getId(), "3");

    const Comment* bob = document->findComment("3");
    ASSERT_NE(bob, nullptr);
    EXPECT_EQ(bob->getAuthor(), "Bob");
    EXPECT_EQ(bob->getInitials(), "XX");
    EXPECT_EQ(bob->getDate(), "2024-03-01T10:00:00Z");
    EXPECT_EQ(bob->getText(), "second note");
    EXPECT_EQ(bob->getDocument(), document.get());
    EXPECT_EQ(document->findComment("rId4"), nullptr);
}

TEST_F(DocumentAssemblerTest, MultipleCommentsPartsPermissive) {
    PackageBuilder builder;
    builder.addComments("rId4", "comments.xml", test::commentXml("1", "Alice", "kept"))
           .addComments("rId5", "comments2.xml", test::commentXml("2", "Bob", "ignored"));

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    ASSERT_EQ(document->getComments().size(), 1u);
    EXPECT_NE(document->findComment("1"), nullptr);
    EXPECT_EQ(document->findComment("2"), nullptr);

    ASSERT_EQ(document->getDiagnostics().size(), 1u);
    EXPECT_EQ(document->getDiagnostics()[0].code, ErrorCode::MultipleCommentsParts);
}

TEST_F(DocumentAssemblerTest, MultipleCommentsPartsStrict) {
    PackageBuilder builder;
    builder.addComments("rId4", "comments.xml", test::commentXml("1", "Alice", "a"))
           .addComments("rId5", "comments2.xml", test::commentXml("2", "Bob", "b"));

    auto result = builder.assemble(strict_);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::MultipleCommentsParts);
}

TEST_F(DocumentAssemblerTest, DuplicateCommentIds) {
    PackageBuilder builder;
    builder.addComments("rId4", "comments.xml",
                        test::commentXml("1", "Alice", "original") + test::commentXml("1", "Mallory", "copy"));

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    ASSERT_EQ(document->getComments().size(), 1u);
    EXPECT_EQ(document->findComment("1")->getAuthor(), "Alice");
    ASSERT_EQ(document->getDiagnostics().size(), 1u);
    EXPECT_EQ(document->getDiagnostics()[0].code, ErrorCode::DuplicateId);

    auto strict = builder.assemble(strict_);
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, ErrorCode::DuplicateId);
}

TEST_F(DocumentAssemblerTest, MissingCommentsPartIsFatal) {
    PackageBuilder builder;
    builder.addRelationship("rId4", Constants::kCommentsRelType, "comments.xml");

    auto result = builder.assemble();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::PartNotFound);
}

TEST_F(DocumentAssemblerTest, MalformedCommentsPartIsFatal) {
    PackageBuilder builder;
    builder.addPart("word/comments.xml", Constants::kCommentsContentType, "<w:comments")
           .addRelationship("rId4", Constants::kCommentsRelType, "comments.xml");

    auto result = builder.assemble();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::XmlParseError);
    EXPECT_EQ(result.error().context, "word/comments.xml");
}

// ========== 嵌入对象 ==========

TEST_F(DocumentAssemblerTest, EmbedsOleObjectsBeforePackages) {
    PackageBuilder builder;
    builder.addPart("word/embeddings/Microsoft_Excel_Worksheet.xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet", "PK")
           .addPart("word/embeddings/oleObject1.bin", "application/vnd.openxmlformats-officedocument.oleObject", "OLE")
           .addRelationship("rId8", Constants::kPackageRelType, "embeddings/Microsoft_Excel_Worksheet.xlsx")
           .addRelationship("rId9", Constants::kOleObjectRelType, "embeddings/oleObject1.bin");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);

    const auto& embeds = document->getAllEmbeds();
    ASSERT_EQ(embeds.size(), 2u);
    EXPECT_EQ(embeds[0]->path, "word/embeddings/oleObject1.bin");
    EXPECT_EQ(embeds[1]->path, "word/embeddings/Microsoft_Excel_Worksheet.xlsx");
    EXPECT_EQ(embeds[0]->data, "OLE");
}

TEST_F(DocumentAssemblerTest, MissingEmbedIsPerItemFailure) {
    PackageBuilder builder;
    builder.addPart("word/embeddings/oleObject1.bin", "application/vnd.openxmlformats-officedocument.oleObject", "OLE")
           .addRelationship("rId9", Constants::kOleObjectRelType, "embeddings/oleObject1.bin")
           .addRelationship("rId10", Constants::kOleObjectRelType, "embeddings/oleObject2.bin");

    auto document = assembleOk(builder);
    ASSERT_NE(document, nullptr);
    ASSERT_EQ(document->getAllEmbeds().size(), 1u);
    ASSERT_EQ(document->getDiagnostics().size(), 1u);
    EXPECT_EQ(document->getDiagnostics()[0].item, "embed");
    EXPECT_EQ(document->getDiagnostics()[0].relationship_id, "rId10");

    auto strict = builder.assemble(strict_);
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, ErrorCode::PerItemResolutionFailure);
}

// ========== 样式保持延迟 ==========

TEST_F(DocumentAssemblerTest, StylesAreNotParsedDuringAssembly) {
    PackageBuilder builder;
    builder.addPart("word/styles.xml", Constants::kStylesContentType, "this is not xml")
           .addRelationship("rId2", Constants::kStylesRelType, "styles.xml");

    auto parser = std::make_shared<test::CountingParser>();
    auto result = builder.assemble(DocumentOptions(), parser);
    ASSERT_TRUE(result);
    EXPECT_EQ(parser->getStylesParseCount(), 0);

    auto styles = result.value()->tryGetStyles();
    ASSERT_FALSE(styles);
    EXPECT_EQ(styles.error().code, ErrorCode::XmlParseError);
    EXPECT_EQ(parser->getStylesParseCount(), 1);
}

}} // namespace fastword::core

#pragma once

#include "fastword/core/BodyElement.hpp"
#include <string>
#include <vector>

namespace fastword {
namespace core {

class Hyperlink;
class Comment;

/**
 * @brief 段落（w:p）
 *
 * 超链接和批注引用通过所属 Document 的ID索引解析。
 */
class Paragraph : public IBodyElement {
public:
    Paragraph(const xml::XMLElement& element, const Document* document);

    BodyElementType getElementType() const override { return BodyElementType::Paragraph; }
    const xml::XMLElement& getElement() const override { return *element_; }
    const Document* getDocument() const override { return document_; }

    /**
     * @brief 段落文本
     *
     * 按顺序拼接 w:t，w:tab 记为 '\t'，w:br / w:cr 记为 '\n'，
     * 包括嵌在 w:hyperlink、w:ins 等容器里的 run。
     */
    std::string getText() const override;

    /**
     * @brief 段落样式ID（w:pPr/w:pStyle/@w:val），没有时为空
     */
    std::string getStyleId() const;

    /**
     * @brief 段落里 w:hyperlink/@r:id 的引用（文档顺序，去重）
     */
    std::vector<std::string> getHyperlinkIds() const;

    /**
     * @brief 解析后的超链接，Document 中不存在的ID被跳过
     */
    std::vector<const Hyperlink*> getHyperlinks() const;

    /**
     * @brief 段落里 w:commentRangeStart / w:commentReference 的批注ID（去重）
     */
    std::vector<std::string> getCommentIds() const;

    std::vector<const Comment*> getComments() const;

    bool isEmpty() const { return getText().empty(); }

    /**
     * @brief 从任意 w:p 节点提取文本
     */
    static std::string extractText(const xml::XMLElement& paragraph);

private:
    const xml::XMLElement* element_;
    const Document* document_;
};

}} // namespace fastword::core

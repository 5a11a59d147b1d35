#pragma once

#include "fastword/core/BodyElement.hpp"
#include "fastword/core/Paragraph.hpp"
#include <string>
#include <vector>

namespace fastword {
namespace core {

/**
 * @brief 表格（w:tbl）
 *
 * 行、单元格按 w:tr / w:tc 的文档顺序编号，从 0 开始。
 */
class Table : public IBodyElement {
public:
    Table(const xml::XMLElement& element, const Document* document);

    BodyElementType getElementType() const override { return BodyElementType::Table; }
    const xml::XMLElement& getElement() const override { return *element_; }
    const Document* getDocument() const override { return document_; }

    size_t getRowCount() const { return rows_.size(); }

    /**
     * @brief 某一行的单元格数，行号越界时为 0
     */
    size_t getColumnCount(size_t row) const;

    /**
     * @brief 单元格内容（按顺序的段落和嵌套表格）
     */
    std::vector<std::unique_ptr<IBodyElement>> getCellElements(size_t row, size_t col) const;

    /**
     * @brief 单元格文本，段落之间用 '\n' 分隔；越界时为空
     */
    std::string getCellText(size_t row, size_t col) const;

    /**
     * @brief 整表文本：单元格用 '\t' 分隔，行用 '\n' 分隔
     */
    std::string getText() const override;

private:
    const xml::XMLElement* element_;
    const Document* document_;
    std::vector<std::vector<const xml::XMLElement*>> rows_;  // w:tr -> w:tc

    const xml::XMLElement* getCell(size_t row, size_t col) const;
};

}} // namespace fastword::core

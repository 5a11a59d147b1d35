#include "fastword/core/Table.hpp"
#include "fastword/core/Constants.hpp"

namespace fastword {
namespace core {

Table::Table(const xml::XMLElement& element, const Document* document)
    : element_(&element), document_(document) {
    for (const xml::XMLElement* row : element.findChildren(Constants::kWordprocessingNS, "tr")) {
        rows_.push_back(row->findChildren(Constants::kWordprocessingNS, "tc"));
    }
}

size_t Table::getColumnCount(size_t row) const {
    return row < rows_.size() ? rows_[row].size() : 0;
}

const xml::XMLElement* Table::getCell(size_t row, size_t col) const {
    if (row >= rows_.size() || col >= rows_[row].size()) {
        return nullptr;
    }
    return rows_[row][col];
}

std::vector<std::unique_ptr<IBodyElement>> Table::getCellElements(size_t row, size_t col) const {
    const xml::XMLElement* cell = getCell(row, col);
    if (!cell) {
        return {};
    }
    return collectBodyElements(*cell, document_);
}

std::string Table::getCellText(size_t row, size_t col) const {
    std::string text;
    bool first = true;
    for (const auto& element : getCellElements(row, col)) {
        if (!first) {
            text.push_back('\n');
        }
        text += element->getText();
        first = false;
    }
    return text;
}

std::string Table::getText() const {
    std::string text;
    for (size_t row = 0; row < rows_.size(); ++row) {
        if (row > 0) {
            text.push_back('\n');
        }
        for (size_t col = 0; col < rows_[row].size(); ++col) {
            if (col > 0) {
                text.push_back('\t');
            }
            text += getCellText(row, col);
        }
    }
    return text;
}

}} // namespace fastword::core

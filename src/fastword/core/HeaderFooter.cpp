#include "fastword/core/HeaderFooter.hpp"

namespace fastword {
namespace core {

HeaderFooter::HeaderFooter(HeaderFooterKind kind, std::string relationship_id, std::string part_path,
                           std::unique_ptr<xml::XMLElement> root, const Document* document)
    : kind_(kind)
    , relationship_id_(std::move(relationship_id))
    , part_path_(std::move(part_path))
    , root_(std::move(root)) {
    elements_ = collectBodyElements(*root_, document);
}

std::vector<const Paragraph*> HeaderFooter::getParagraphs() const {
    std::vector<const Paragraph*> result;
    for (const auto& element : elements_) {
        if (element->getElementType() == BodyElementType::Paragraph) {
            result.push_back(static_cast<const Paragraph*>(element.get()));
        }
    }
    return result;
}

std::vector<const Table*> HeaderFooter::getTables() const {
    std::vector<const Table*> result;
    for (const auto& element : elements_) {
        if (element->getElementType() == BodyElementType::Table) {
            result.push_back(static_cast<const Table*>(element.get()));
        }
    }
    return result;
}

std::string HeaderFooter::getText() const {
    std::string text;
    for (size_t i = 0; i < elements_.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += elements_[i]->getText();
    }
    return text;
}

}} // namespace fastword::core

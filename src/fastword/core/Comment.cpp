#include "fastword/core/Comment.hpp"
#include "fastword/core/BodyElement.hpp"
#include "fastword/core/Constants.hpp"

namespace fastword {
namespace core {

Comment::Comment(const xml::XMLElement& element, const Document* document)
    : element_(&element)
    , document_(document)
    , id_(element.getAttribute(Constants::kWordprocessingNS, "id")) {
}

std::string Comment::getAuthor() const {
    return element_->getAttribute(Constants::kWordprocessingNS, "author");
}

std::string Comment::getInitials() const {
    return element_->getAttribute(Constants::kWordprocessingNS, "initials");
}

std::string Comment::getDate() const {
    return element_->getAttribute(Constants::kWordprocessingNS, "date");
}

std::string Comment::getText() const {
    std::string text;
    bool first = true;
    for (const auto& element : collectBodyElements(*element_, document_)) {
        if (!first) {
            text.push_back('\n');
        }
        text += element->getText();
        first = false;
    }
    return text;
}

}} // namespace fastword::core

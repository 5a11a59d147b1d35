#include "fastword/core/Paragraph.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/core/Document.hpp"
#include <algorithm>

namespace fastword {
namespace core {

namespace {

void appendRunText(const xml::XMLElement& element, std::string& out) {
    for (const auto& child : element.children) {
        // 图形、mc:AlternateContent 等非 WordprocessingML 内容不参与
        if (child->namespace_uri != Constants::kWordprocessingNS) {
            continue;
        }

        const std::string& name = child->local_name;
        if (name == "t") {
            out += child->text;
        } else if (name == "tab") {
            out.push_back('\t');
        } else if (name == "br" || name == "cr") {
            out.push_back('\n');
        } else if (name == "pPr" || name == "rPr" || name == "del" || name == "txbxContent") {
            continue;
        } else {
            appendRunText(*child, out);
        }
    }
}

void collectAttributeValues(const xml::XMLElement& element, const char* local_name,
                            const char* attr_ns, std::vector<std::string>& out) {
    element.visitDescendants([&](const xml::XMLElement& node) {
        if (node.is(Constants::kWordprocessingNS, local_name)) {
            auto value = node.findAttribute(attr_ns, "id");
            if (value && !value->empty() && std::find(out.begin(), out.end(), *value) == out.end()) {
                out.push_back(*value);
            }
        }
        return true;
    });
}

} // namespace

Paragraph::Paragraph(const xml::XMLElement& element, const Document* document)
    : element_(&element), document_(document) {
}

std::string Paragraph::extractText(const xml::XMLElement& paragraph) {
    std::string text;
    appendRunText(paragraph, text);
    return text;
}

std::string Paragraph::getText() const {
    return extractText(*element_);
}

std::string Paragraph::getStyleId() const {
    const xml::XMLElement* ppr = element_->findChild(Constants::kWordprocessingNS, "pPr");
    if (!ppr) {
        return "";
    }
    const xml::XMLElement* style = ppr->findChild(Constants::kWordprocessingNS, "pStyle");
    return style ? style->getAttribute(Constants::kWordprocessingNS, "val") : "";
}

std::vector<std::string> Paragraph::getHyperlinkIds() const {
    std::vector<std::string> ids;
    collectAttributeValues(*element_, "hyperlink", Constants::kRelationshipsNS, ids);
    return ids;
}

std::vector<const Hyperlink*> Paragraph::getHyperlinks() const {
    std::vector<const Hyperlink*> result;
    if (!document_) {
        return result;
    }
    for (const auto& id : getHyperlinkIds()) {
        if (const Hyperlink* link = document_->findHyperlink(id)) {
            result.push_back(link);
        }
    }
    return result;
}

std::vector<std::string> Paragraph::getCommentIds() const {
    std::vector<std::string> ids;
    collectAttributeValues(*element_, "commentRangeStart", Constants::kWordprocessingNS, ids);
    collectAttributeValues(*element_, "commentReference", Constants::kWordprocessingNS, ids);
    return ids;
}

std::vector<const Comment*> Paragraph::getComments() const {
    std::vector<const Comment*> result;
    if (!document_) {
        return result;
    }
    for (const auto& id : getCommentIds()) {
        if (const Comment* comment = document_->findComment(id)) {
            result.push_back(comment);
        }
    }
    return result;
}

}} // namespace fastword::core

#pragma once

#include "fastword/xml/XMLElement.hpp"
#include <string>

namespace fastword {
namespace core {

class Document;

/**
 * @brief 批注（w:comments/w:comment）
 *
 * ID 取自节点自身的 w:id 属性。
 */
class Comment {
public:
    Comment(const xml::XMLElement& element, const Document* document);

    const std::string& getId() const { return id_; }
    std::string getAuthor() const;
    std::string getInitials() const;
    std::string getDate() const;

    /**
     * @brief 批注文本，段落之间用 '\n' 分隔
     */
    std::string getText() const;

    const xml::XMLElement& getElement() const { return *element_; }
    const Document* getDocument() const { return document_; }

private:
    const xml::XMLElement* element_;
    const Document* document_;
    std::string id_;
};

}} // namespace fastword::core

#pragma once

#include "fastword/xml/XMLElement.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fastword {
namespace core {

class Document;

/**
 * @brief 块级元素类型
 */
enum class BodyElementType {
    Paragraph,
    Table
};

/**
 * @brief 块级元素接口（段落、表格）
 *
 * 包装解析树中的一个节点，并持有所属 Document 的非拥有指针。
 * 生命周期不能超过 Document。
 */
class IBodyElement {
public:
    virtual ~IBodyElement() = default;

    virtual BodyElementType getElementType() const = 0;
    virtual const xml::XMLElement& getElement() const = 0;
    virtual const Document* getDocument() const = 0;
    virtual std::string getText() const = 0;
};

/**
 * @brief 按文档顺序收集容器（w:body、w:hdr、w:tc 等）下的段落和表格
 */
std::vector<std::unique_ptr<IBodyElement>> collectBodyElements(const xml::XMLElement& container,
                                                                const Document* document);

}} // namespace fastword::core

#pragma once

#include "fastword/core/BodyElement.hpp"
#include "fastword/core/Paragraph.hpp"
#include "fastword/core/Table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace fastword {
namespace core {

enum class HeaderFooterKind {
    Header,  // w:hdr
    Footer   // w:ftr
};

/**
 * @brief 页眉或页脚部件
 *
 * 拥有部件的解析树；内容按文档顺序包装成段落和表格。
 */
class HeaderFooter {
public:
    HeaderFooter(HeaderFooterKind kind, std::string relationship_id, std::string part_path,
                 std::unique_ptr<xml::XMLElement> root, const Document* document);

    HeaderFooter(const HeaderFooter&) = delete;
    HeaderFooter& operator=(const HeaderFooter&) = delete;

    HeaderFooterKind getKind() const { return kind_; }
    const std::string& getRelationshipId() const { return relationship_id_; }
    const std::string& getPartPath() const { return part_path_; }
    const xml::XMLElement& getRoot() const { return *root_; }

    const std::vector<std::unique_ptr<IBodyElement>>& getBodyElements() const { return elements_; }
    std::vector<const Paragraph*> getParagraphs() const;
    std::vector<const Table*> getTables() const;

    /**
     * @brief 全部内容文本，块级元素之间用 '\n' 分隔
     */
    std::string getText() const;

private:
    HeaderFooterKind kind_;
    std::string relationship_id_;
    std::string part_path_;
    std::unique_ptr<xml::XMLElement> root_;
    std::vector<std::unique_ptr<IBodyElement>> elements_;
};

}} // namespace fastword::core

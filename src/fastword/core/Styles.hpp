#pragma once

#include "fastword/xml/XMLElement.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastword {
namespace core {

/**
 * @brief 单个样式定义（w:style）
 */
struct Style {
    std::string id;          // w:styleId
    std::string type;        // paragraph / character / table / numbering
    std::string name;        // w:name/@w:val
    std::string based_on;    // w:basedOn/@w:val
    std::string next;        // w:next/@w:val
    std::string link;        // w:link/@w:val
    bool is_default = false; // w:default="1"
    bool is_custom = false;  // w:customStyle="1"
};

/**
 * @brief 样式部件（w:styles）
 *
 * 拥有解析树，并按声明顺序建立样式ID索引；重复的ID只保留第一个。
 */
class Styles {
public:
    explicit Styles(std::unique_ptr<xml::XMLElement> root);

    Styles(const Styles&) = delete;
    Styles& operator=(const Styles&) = delete;

    const xml::XMLElement& getRoot() const { return *root_; }

    const std::vector<Style>& getStyles() const { return styles_; }
    size_t getStyleCount() const { return styles_.size(); }

    /**
     * @brief 按ID查找样式
     * @return 未找到返回nullptr
     */
    const Style* getStyle(const std::string& style_id) const;

    bool styleExist(const std::string& style_id) const { return getStyle(style_id) != nullptr; }

    /**
     * @brief 某类样式的默认样式ID，没有时为空
     */
    std::string getDefaultStyleId(const std::string& type) const;

    /**
     * @brief 样式及其 basedOn 祖先链（从自身开始，遇到环或缺失时停止）
     */
    std::vector<const Style*> getStyleChain(const std::string& style_id) const;

    /**
     * @brief 样式引用到的全部样式（basedOn、next、link 的闭包，含自身）
     */
    std::vector<const Style*> getUsedStyleList(const std::string& style_id) const;

    /**
     * @brief 按名称查找样式ID，没有时为空
     */
    std::string getStyleIdByName(const std::string& name) const;

private:
    std::unique_ptr<xml::XMLElement> root_;
    std::vector<Style> styles_;
    std::unordered_map<std::string, size_t> style_index_;
};

}} // namespace fastword::core

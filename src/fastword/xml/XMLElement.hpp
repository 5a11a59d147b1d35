#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <unordered_map>

namespace fastword {
namespace xml {

/**
 * @brief 轻量级DOM节点
 *
 * 由 XMLStreamReader::parseToDOM 构建。开启命名空间解析时，
 * 元素名与属性名的形式为 "命名空间URI|本地名"，无命名空间时只有本地名。
 */
struct XMLElement {
    static constexpr char kNamespaceSeparator = '|';

    std::string name;            // 原始名称（可能带命名空间前缀）
    std::string namespace_uri;   // 命名空间URI，可能为空
    std::string local_name;      // 本地名
    std::unordered_map<std::string, std::string> attributes;
    std::string text;            // 第一个子元素之前的文本
    std::string tail;            // 本元素结束标签之后、下一个兄弟之前的文本
    std::vector<std::unique_ptr<XMLElement>> children;
    XMLElement* parent = nullptr;

    explicit XMLElement(const std::string& qualified_name);

    /**
     * @brief 把 "uri|local" 拆成命名空间和本地名
     */
    static std::pair<std::string_view, std::string_view> splitName(std::string_view qualified_name);

    /**
     * @brief 组合属性/元素的查找键
     */
    static std::string makeKey(std::string_view namespace_uri, std::string_view local_name);

    bool is(std::string_view ns, std::string_view local) const {
        return local_name == local && namespace_uri == ns;
    }

    // 查找子元素（仅直接子节点）
    const XMLElement* findChild(std::string_view ns, std::string_view local) const;
    std::vector<const XMLElement*> findChildren(std::string_view ns, std::string_view local) const;
    const XMLElement* findChild(const std::string& qualified_name) const;

    // 属性操作
    std::optional<std::string> findAttribute(std::string_view ns, std::string_view local) const;
    std::string getAttribute(std::string_view ns, std::string_view local, const std::string& default_value = "") const;
    std::string getRawAttribute(const std::string& key, const std::string& default_value = "") const;  // 键形如 "uri|local"

    // 文本内容
    const std::string& getTextContent() const { return text; }
    std::string getInnerText() const;  // 递归拼接所有子节点文本

    // 子元素操作
    XMLElement* appendChild(const std::string& qualified_name);

    // 遍历：先序，回调返回 false 时不进入该节点的子树
    void visitDescendants(const std::function<bool(const XMLElement&)>& visitor) const;

    size_t getChildCount() const { return children.size(); }
    bool hasChildren() const { return !children.empty(); }
    int getDepth() const;
};

}} // namespace fastword::xml

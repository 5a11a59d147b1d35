#pragma once

#include "fastword/core/Diagnostic.hpp"
#include "fastword/core/Expected.hpp"
#include "fastword/core/HeaderFooter.hpp"
#include <memory>
#include <vector>

namespace fastword {
namespace core {

/**
 * @brief 页眉页脚在节内的用途（w:headerReference/@w:type）
 */
enum class HeaderFooterType {
    Default,  // 默认（奇数页）
    First,    // 首页
    Even      // 偶数页
};

/**
 * @brief 页眉页脚选择策略
 *
 * 由正文最后一个 w:sectPr 构建，引用按关系ID对应到 Document 已加载的页眉页脚。
 * 选择规则：
 * - 第 1 页：节设置了 w:titlePg 且存在首页变体时用首页变体
 * - 偶数页：存在偶数页变体时用偶数页变体
 * - 其余：默认变体（可能为空）
 */
class HeaderFooterPolicy {
public:
    /**
     * @brief 根据文档的节属性构建策略
     * @param diagnostics 无法对应的引用追加到这里
     * @return 严格策略下出现无法对应的引用时为 PerItemResolutionFailure
     */
    static Result<std::unique_ptr<HeaderFooterPolicy>> create(const Document& document,
                                                              std::vector<Diagnostic>& diagnostics);

    const HeaderFooter* getDefaultHeader() const { return headers_[index(HeaderFooterType::Default)]; }
    const HeaderFooter* getFirstPageHeader() const { return headers_[index(HeaderFooterType::First)]; }
    const HeaderFooter* getEvenPageHeader() const { return headers_[index(HeaderFooterType::Even)]; }

    const HeaderFooter* getDefaultFooter() const { return footers_[index(HeaderFooterType::Default)]; }
    const HeaderFooter* getFirstPageFooter() const { return footers_[index(HeaderFooterType::First)]; }
    const HeaderFooter* getEvenPageFooter() const { return footers_[index(HeaderFooterType::Even)]; }

    /**
     * @brief 指定页（从 1 开始）使用的页眉，没有时返回nullptr
     */
    const HeaderFooter* getHeader(int page) const;
    const HeaderFooter* getFooter(int page) const;

    bool isTitlePage() const { return title_page_; }
    bool hasSectionProperties() const { return has_section_; }

private:
    HeaderFooterPolicy() = default;

    static constexpr size_t index(HeaderFooterType type) { return static_cast<size_t>(type); }
    const HeaderFooter* select(const HeaderFooter* default_variant, const HeaderFooter* first_variant,
                              const HeaderFooter* even_variant, int page) const;

    const HeaderFooter* headers_[3] = {nullptr, nullptr, nullptr};
    const HeaderFooter* footers_[3] = {nullptr, nullptr, nullptr};
    bool title_page_ = false;
    bool has_section_ = false;
};

}} // namespace fastword::core

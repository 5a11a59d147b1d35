#pragma once

#include "fastword/core/BodyElement.hpp"
#include "fastword/core/Comment.hpp"
#include "fastword/core/Diagnostic.hpp"
#include "fastword/core/DocumentOptions.hpp"
#include "fastword/core/Expected.hpp"
#include "fastword/core/HeaderFooter.hpp"
#include "fastword/core/HeaderFooterPolicy.hpp"
#include "fastword/core/Hyperlink.hpp"
#include "fastword/core/LazyResult.hpp"
#include "fastword/core/Paragraph.hpp"
#include "fastword/core/Styles.hpp"
#include "fastword/core/Table.hpp"
#include "fastword/opc/PartGraph.hpp"
#include "fastword/reader/IStructuralParser.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fastword {
namespace core {

/**
 * @brief 装配完成的 WordprocessingML 文档
 *
 * 装配结束后是只读快照，可以被多个线程同时读取；
 * 唯一的延迟状态是样式，首次访问时在锁内解析一次并缓存结果。
 *
 * Paragraph、Table 等包装对象持有指向本对象的指针，
 * 因此 Document 不可拷贝也不可移动，总是通过 std::unique_ptr 交给调用者。
 */
class Document {
public:
    ~Document();

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;
    Document(Document&&) = delete;
    Document& operator=(Document&&) = delete;

    /**
     * @brief 打开 .docx 文件
     * @param path 文件路径
     * @param options 打开选项
     * @return 装配好的文档
     * @throws PackageException 文件不存在、不是ZIP或缺少主文档
     * @throws AssemblyException 主文档损坏，或严格策略下的逐项失败
     */
    static std::unique_ptr<Document> open(const std::string& path, const DocumentOptions& options = DocumentOptions());

    // ========== 正文 ==========

    /**
     * @brief 正文的块级元素（段落和表格按文档顺序交错）
     */
    const std::vector<std::unique_ptr<IBodyElement>>& getBodyElements() const { return body_elements_; }
    std::vector<const Paragraph*> getParagraphs() const;
    std::vector<const Table*> getTables() const;

    /**
     * @brief 原始的 w:body 元素
     */
    const xml::XMLElement& getDocumentBody() const { return *body_; }

    /**
     * @brief 正文全部文本，块级元素之间用 '\n' 分隔
     */
    std::string getText() const;

    // ========== 超链接 ==========

    const std::vector<Hyperlink>& getHyperlinks() const { return hyperlinks_; }

    /**
     * @brief 按关系ID查找超链接
     * @return 不存在返回nullptr
     */
    const Hyperlink* findHyperlink(const std::string& id) const;

    // ========== 批注 ==========

    /**
     * @brief 所有批注（批注部件中的顺序）
     */
    std::vector<const Comment*> getComments() const;

    /**
     * @brief 按批注ID查找
     * @return 不存在返回nullptr
     */
    const Comment* findComment(const std::string& id) const;

    // ========== 样式 ==========

    /**
     * @brief 样式（首次访问时解析）
     * @throws CardinalityException styles 关系不是恰好一个
     * @throws XMLException 样式部件损坏
     */
    const Styles& getStyles() const;

    /**
     * @brief getStyles() 的不抛异常版本
     */
    Result<const Styles*> tryGetStyles() const;

    // ========== 部件 ==========

    /**
     * @brief 按主文档的关系ID取目标部件
     * @throws RelationshipException 关系不存在（UnknownRelationshipId）或目标部件不存在（PartNotFound）
     */
    const opc::PartGraph::Part& getPartById(const std::string& id) const;

    Result<const opc::PartGraph::Part*> findPartById(const std::string& id) const;

    /**
     * @brief 嵌入对象：先 oleObject 再 package，各自按关系声明顺序
     */
    const std::vector<const opc::PartGraph::Part*>& getAllEmbeds() const { return embeds_; }

    // ========== 页眉页脚 ==========

    const std::vector<std::unique_ptr<HeaderFooter>>& getHeaderList() const { return headers_; }
    const std::vector<std::unique_ptr<HeaderFooter>>& getFooterList() const { return footers_; }
    const HeaderFooter* findHeader(const std::string& relationship_id) const;
    const HeaderFooter* findFooter(const std::string& relationship_id) const;

    /**
     * @brief 页眉页脚策略；load_header_footer 关闭时为nullptr
     */
    const HeaderFooterPolicy* getHeaderFooterPolicy() const { return header_footer_policy_.get(); }

    // ========== 其它 ==========

    const std::vector<Diagnostic>& getDiagnostics() const { return diagnostics_; }
    const std::string& getCorePartPath() const { return core_part_path_; }
    const opc::PartGraph& getPartGraph() const { return *graph_; }
    const DocumentOptions& getOptions() const { return options_; }

private:
    friend class DocumentAssembler;

    Document(std::shared_ptr<const opc::PartGraph> graph,
             std::string core_part_path,
             std::shared_ptr<const reader::IStructuralParser> parser,
             DocumentOptions options);

    Result<std::unique_ptr<Styles>> loadStyles() const;
    static const HeaderFooter* findIn(const std::vector<std::unique_ptr<HeaderFooter>>& list,
                                      const std::string& relationship_id);

    std::shared_ptr<const opc::PartGraph> graph_;
    std::string core_part_path_;
    std::shared_ptr<const reader::IStructuralParser> parser_;
    DocumentOptions options_;

    std::unique_ptr<xml::XMLElement> root_;        // w:document
    const xml::XMLElement* body_ = nullptr;        // w:body
    std::vector<std::unique_ptr<IBodyElement>> body_elements_;

    std::vector<Hyperlink> hyperlinks_;
    std::unordered_map<std::string, size_t> hyperlink_index_;

    std::unique_ptr<xml::XMLElement> comments_root_;  // w:comments
    std::vector<Comment> comments_;
    std::unordered_map<std::string, size_t> comment_index_;

    std::vector<const opc::PartGraph::Part*> embeds_;

    std::vector<std::unique_ptr<HeaderFooter>> headers_;
    std::vector<std::unique_ptr<HeaderFooter>> footers_;
    std::unique_ptr<HeaderFooterPolicy> header_footer_policy_;

    std::vector<Diagnostic> diagnostics_;

    mutable LazyResult<Styles> styles_;
};

}} // namespace fastword::core

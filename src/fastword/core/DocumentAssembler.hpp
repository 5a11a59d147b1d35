#pragma once

#include "fastword/core/Document.hpp"
#include "fastword/core/DocumentOptions.hpp"
#include "fastword/core/Expected.hpp"
#include "fastword/opc/PartGraph.hpp"
#include "fastword/reader/IStructuralParser.hpp"
#include <memory>
#include <string>

namespace fastword {
namespace core {

/**
 * @brief 文档装配器
 *
 * 从部件图和主文档部件出发，按关系类型逐类解析：
 * 正文 → 超链接 → 批注 → 嵌入对象 → 页眉页脚 → 页眉页脚策略。
 * 样式不在这里解析，由 Document::getStyles() 首次访问时完成。
 *
 * 装配器本身无状态，可以复用。
 */
class DocumentAssembler {
public:
    /**
     * @brief 构造装配器
     * @param options 装配选项
     * @param parser 结构解析器，为空时使用 WordMLParser
     */
    explicit DocumentAssembler(DocumentOptions options = DocumentOptions(),
                               std::shared_ptr<const reader::IStructuralParser> parser = nullptr);

    /**
     * @brief 以指定部件为主文档装配
     * @param root_part_path 主文档部件路径（如 "word/document.xml"）
     * @param graph 部件图，Document 会共享持有
     * @return 装配好的文档；主文档损坏为 MalformedRootPart
     */
    Result<std::unique_ptr<Document>> assemble(const std::string& root_part_path,
                                               std::shared_ptr<const opc::PartGraph> graph) const;

    /**
     * @brief 通过包级 officeDocument 关系定位主文档后装配
     */
    Result<std::unique_ptr<Document>> assembleFromPackage(std::shared_ptr<const opc::PartGraph> graph) const;

    const DocumentOptions& getOptions() const { return options_; }

private:
    bool isStrict() const { return options_.policy == AssemblyPolicy::Strict; }

    VoidResult loadBody(Document& document) const;
    VoidResult loadHyperlinks(Document& document) const;
    VoidResult loadComments(Document& document) const;
    VoidResult loadEmbeds(Document& document) const;
    VoidResult loadHeadersFooters(Document& document, HeaderFooterKind kind) const;

    /**
     * @brief 逐项失败：严格策略返回错误，宽松策略记录诊断后继续
     */
    VoidResult reportItemFailure(Document& document, ErrorCode code, const std::string& item,
                                 const std::string& relationship_id, const std::string& message) const;

    DocumentOptions options_;
    std::shared_ptr<const reader::IStructuralParser> parser_;
};

}} // namespace fastword::core

#include "fastword/core/DocumentAssembler.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/reader/WordMLParser.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastword {
namespace core {

DocumentAssembler::DocumentAssembler(DocumentOptions options,
                                     std::shared_ptr<const reader::IStructuralParser> parser)
    : options_(options)
    , parser_(std::move(parser)) {
    if (!parser_) {
        parser_ = std::make_shared<reader::WordMLParser>();
    }
}

Result<std::unique_ptr<Document>> DocumentAssembler::assembleFromPackage(
    std::shared_ptr<const opc::PartGraph> graph) const {
    if (!graph) {
        return makeError(ErrorCode::InvalidArgument, "Part graph is null");
    }

    auto main_part = graph->getMainDocumentPart();
    if (!main_part) {
        return main_part.error();
    }

    const std::string& content_type = main_part.value()->content_type;
    if (content_type != Constants::kMainContentType &&
        content_type != Constants::kMacroMainContentType &&
        content_type != Constants::kTemplateMainContentType) {
        CORE_WARN("Main document part {} has unexpected content type '{}'",
                  main_part.value()->path, content_type);
    }

    return assemble(main_part.value()->path, std::move(graph));
}

Result<std::unique_ptr<Document>> DocumentAssembler::assemble(const std::string& root_part_path,
                                                              std::shared_ptr<const opc::PartGraph> graph) const {
    if (!graph) {
        return makeError(ErrorCode::InvalidArgument, "Part graph is null");
    }
    if (!graph->hasPart(root_part_path)) {
        return makeError(ErrorCode::PartNotFound, "Root part not found in package", root_part_path);
    }

    CORE_DEBUG("Assembling document from {} ({} policy)", root_part_path,
               isStrict() ? "strict" : "permissive");

    std::unique_ptr<Document> document(new Document(std::move(graph), root_part_path, parser_, options_));

    VoidResult result = loadBody(*document);
    if (!result) {
        return result.error();
    }

    result = loadHyperlinks(*document);
    if (!result) {
        return result.error();
    }

    result = loadComments(*document);
    if (!result) {
        return result.error();
    }

    result = loadEmbeds(*document);
    if (!result) {
        return result.error();
    }

    if (options_.load_header_footer) {
        result = loadHeadersFooters(*document, HeaderFooterKind::Header);
        if (!result) {
            return result.error();
        }
        result = loadHeadersFooters(*document, HeaderFooterKind::Footer);
        if (!result) {
            return result.error();
        }

        auto policy = HeaderFooterPolicy::create(*document, document->diagnostics_);
        if (!policy) {
            return policy.error();
        }
        document->header_footer_policy_ = std::move(policy).value();
    }

    CORE_INFO("Assembled {}: {} body elements, {} hyperlinks, {} comments, {} embeds, {} diagnostics",
              root_part_path, document->body_elements_.size(), document->hyperlinks_.size(),
              document->comments_.size(), document->embeds_.size(), document->diagnostics_.size());

    return std::move(document);
}

VoidResult DocumentAssembler::loadBody(Document& document) const {
    const opc::PartGraph::Part* root_part = document.graph_->getPart(document.core_part_path_);

    auto root = parser_->parse(root_part->data, reader::SchemaKind::Document);
    if (!root) {
        CORE_ERROR("Failed to parse root part {}: {}", root_part->path, root.error().message);
        return makeError(ErrorCode::MalformedRootPart,
                         fmt::format("Root part is not a valid document: {}", root.error().message),
                         root_part->path);
    }

    document.root_ = std::move(root).value();
    document.body_ = document.root_->findChild(Constants::kWordprocessingNS, "body");
    if (!document.body_) {
        return makeError(ErrorCode::MalformedRootPart, "Root part has no w:body element", root_part->path);
    }

    document.body_elements_ = collectBodyElements(*document.body_, &document);
    return success();
}

VoidResult DocumentAssembler::loadHyperlinks(Document& document) const {
    const opc::PartGraph& graph = *document.graph_;
    auto rels = graph.getRelationshipsByType(document.core_part_path_, Constants::kHyperlinkRelType);

    document.hyperlinks_.reserve(rels.size());
    for (const opc::PartGraph::Relationship* rel : rels) {
        auto uri = graph.resolveTargetUri(document.core_part_path_, *rel);
        if (uri) {
            document.hyperlinks_.emplace_back(rel->id, std::move(uri).value());
        } else {
            VoidResult reported = reportItemFailure(document, ErrorCode::PerItemResolutionFailure, "hyperlink",
                                                    rel->id, uri.error().fullMessage());
            if (!reported) {
                return reported;
            }
            document.hyperlinks_.emplace_back(rel->id, uri.error());
        }
        document.hyperlink_index_.emplace(rel->id, document.hyperlinks_.size() - 1);
    }
    return success();
}

VoidResult DocumentAssembler::loadComments(Document& document) const {
    const opc::PartGraph& graph = *document.graph_;
    auto rels = graph.getRelationshipsByType(document.core_part_path_, Constants::kCommentsRelType);
    if (rels.empty()) {
        return success();
    }

    if (rels.size() > 1) {
        std::string message = fmt::format("Expecting at most one comments part, but found {}", rels.size());
        if (isStrict()) {
            return makeError(ErrorCode::MultipleCommentsParts, message, Constants::kCommentsRelType);
        }
        CORE_WARN("{}; using {}", message, rels.front()->id);
        document.diagnostics_.emplace_back(ErrorCode::MultipleCommentsParts, "comments", rels.front()->id, message);
    }

    const opc::PartGraph::Relationship& rel = *rels.front();
    auto part = graph.resolveTargetPart(document.core_part_path_, rel);
    if (!part) {
        return part.error();
    }

    auto root = parser_->parse(part.value()->data, reader::SchemaKind::Comments);
    if (!root) {
        Error error = root.error();
        error.context = part.value()->path;
        return error;
    }
    document.comments_root_ = std::move(root).value();

    for (const xml::XMLElement* node :
         document.comments_root_->findChildren(Constants::kWordprocessingNS, "comment")) {
        Comment comment(*node, &document);
        if (document.comment_index_.count(comment.getId()) > 0) {
            std::string message = fmt::format("Duplicate comment id '{}' in {}", comment.getId(),
                                              part.value()->path);
            if (isStrict()) {
                return makeError(ErrorCode::DuplicateId, message, comment.getId());
            }
            CORE_WARN("{}", message);
            document.diagnostics_.emplace_back(ErrorCode::DuplicateId, "comment", comment.getId(), message);
            continue;
        }
        document.comment_index_.emplace(comment.getId(), document.comments_.size());
        document.comments_.push_back(comment);
    }

    CORE_DEBUG("Loaded {} comments from {}", document.comments_.size(), part.value()->path);
    return success();
}

VoidResult DocumentAssembler::loadEmbeds(Document& document) const {
    const opc::PartGraph& graph = *document.graph_;

    for (const char* type : {Constants::kOleObjectRelType, Constants::kPackageRelType}) {
        for (const opc::PartGraph::Relationship* rel : graph.getRelationshipsByType(document.core_part_path_, type)) {
            auto part = graph.resolveTargetPart(document.core_part_path_, *rel);
            if (!part) {
                VoidResult reported = reportItemFailure(document, ErrorCode::PerItemResolutionFailure, "embed",
                                                        rel->id, part.error().fullMessage());
                if (!reported) {
                    return reported;
                }
                continue;
            }
            document.embeds_.push_back(part.value());
        }
    }
    return success();
}

VoidResult DocumentAssembler::loadHeadersFooters(Document& document, HeaderFooterKind kind) const {
    const opc::PartGraph& graph = *document.graph_;
    const bool header = kind == HeaderFooterKind::Header;
    const char* item = header ? "header" : "footer";
    auto& target_list = header ? document.headers_ : document.footers_;

    auto rels = graph.getRelationshipsByType(document.core_part_path_,
                                             header ? Constants::kHeaderRelType : Constants::kFooterRelType);
    for (const opc::PartGraph::Relationship* rel : rels) {
        auto part = graph.resolveTargetPart(document.core_part_path_, *rel);
        if (!part) {
            VoidResult reported = reportItemFailure(document, ErrorCode::PerItemResolutionFailure, item,
                                                    rel->id, part.error().fullMessage());
            if (!reported) {
                return reported;
            }
            continue;
        }

        auto root = parser_->parse(part.value()->data,
                                   header ? reader::SchemaKind::Header : reader::SchemaKind::Footer);
        if (!root) {
            VoidResult reported = reportItemFailure(
                document, ErrorCode::PerItemResolutionFailure, item, rel->id,
                fmt::format("{} ({})", root.error().message, part.value()->path));
            if (!reported) {
                return reported;
            }
            continue;
        }

        target_list.push_back(std::make_unique<HeaderFooter>(kind, rel->id, part.value()->path,
                                                             std::move(root).value(), &document));
    }
    return success();
}

VoidResult DocumentAssembler::reportItemFailure(Document& document, ErrorCode code, const std::string& item,
                                                const std::string& relationship_id,
                                                const std::string& message) const {
    if (isStrict()) {
        return makeError(code, fmt::format("Failed to resolve {} {}: {}", item, relationship_id, message),
                         relationship_id);
    }
    CORE_WARN("Skipping {} {}: {}", item, relationship_id, message);
    document.diagnostics_.emplace_back(code, item, relationship_id, message);
    return success();
}

}} // namespace fastword::core

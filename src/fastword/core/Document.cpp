#include "fastword/core/Document.hpp"
#include "fastword/core/DocumentAssembler.hpp"
#include "fastword/core/ExceptionBridge.hpp"
#include "fastword/archive/ZipReader.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <filesystem>
#include <fmt/format.h>

namespace fastword {
namespace core {

Document::Document(std::shared_ptr<const opc::PartGraph> graph,
                   std::string core_part_path,
                   std::shared_ptr<const reader::IStructuralParser> parser,
                   DocumentOptions options)
    : graph_(std::move(graph))
    , core_part_path_(std::move(core_part_path))
    , parser_(std::move(parser))
    , options_(options) {
}

Document::~Document() = default;

std::unique_ptr<Document> Document::open(const std::string& path, const DocumentOptions& options) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw PackageException("File not found", path, ErrorCode::FileNotFound);
    }

    archive::ZipReader zip(path);
    archive::ZipError zip_result = zip.open();
    if (archive::isError(zip_result)) {
        throw PackageException(fmt::format("Failed to open package: {}", archive::toString(zip_result)),
                               path, zip_result == archive::ZipError::IoFail ? ErrorCode::FileReadError
                                                                             : ErrorCode::InvalidPackage);
    }

    auto graph = std::make_shared<opc::PartGraph>();
    FASTWORD_UNWRAP(graph->buildFromZipReader(zip, options.max_part_size));
    zip.close();

    CORE_INFO("Opened package {} with {} parts", path, graph->getPartCount());

    DocumentAssembler assembler(options);
    return FASTWORD_UNWRAP(assembler.assembleFromPackage(std::move(graph)));
}

std::vector<const Paragraph*> Document::getParagraphs() const {
    std::vector<const Paragraph*> result;
    for (const auto& element : body_elements_) {
        if (element->getElementType() == BodyElementType::Paragraph) {
            result.push_back(static_cast<const Paragraph*>(element.get()));
        }
    }
    return result;
}

std::vector<const Table*> Document::getTables() const {
    std::vector<const Table*> result;
    for (const auto& element : body_elements_) {
        if (element->getElementType() == BodyElementType::Table) {
            result.push_back(static_cast<const Table*>(element.get()));
        }
    }
    return result;
}

std::string Document::getText() const {
    std::string text;
    for (size_t i = 0; i < body_elements_.size(); ++i) {
        if (i > 0) {
            text.push_back('\n');
        }
        text += body_elements_[i]->getText();
    }
    return text;
}

const Hyperlink* Document::findHyperlink(const std::string& id) const {
    auto it = hyperlink_index_.find(id);
    return it != hyperlink_index_.end() ? &hyperlinks_[it->second] : nullptr;
}

std::vector<const Comment*> Document::getComments() const {
    std::vector<const Comment*> result;
    result.reserve(comments_.size());
    for (const auto& comment : comments_) {
        result.push_back(&comment);
    }
    return result;
}

const Comment* Document::findComment(const std::string& id) const {
    auto it = comment_index_.find(id);
    return it != comment_index_.end() ? &comments_[it->second] : nullptr;
}

const Styles& Document::getStyles() const {
    return *FASTWORD_UNWRAP(tryGetStyles());
}

Result<const Styles*> Document::tryGetStyles() const {
    return styles_.getOrCompute([this]() { return loadStyles(); });
}

Result<std::unique_ptr<Styles>> Document::loadStyles() const {
    auto rels = graph_->getRelationshipsByType(core_part_path_, Constants::kStylesRelType);
    if (rels.size() != 1) {
        CORE_ERROR("Expecting one Styles document part, but found {}", rels.size());
        return makeError(ErrorCode::CardinalityViolation,
                         fmt::format("Expecting one Styles document part, but found {}", rels.size()),
                         Constants::kStylesRelType);
    }

    auto part = graph_->resolveTargetPart(core_part_path_, *rels.front());
    if (!part) {
        return part.error();
    }

    auto root = parser_->parse(part.value()->data, reader::SchemaKind::Styles);
    if (!root) {
        Error error = root.error();
        error.context = part.value()->path;
        return error;
    }

    CORE_DEBUG("Resolved styles part {}", part.value()->path);
    return std::make_unique<Styles>(std::move(root).value());
}

Result<const opc::PartGraph::Part*> Document::findPartById(const std::string& id) const {
    const opc::PartGraph::Relationship* rel = graph_->getRelationship(core_part_path_, id);
    if (!rel) {
        return makeError(ErrorCode::UnknownRelationshipId,
                         fmt::format("No relationship with id {} on {}", id, core_part_path_), id);
    }

    auto part = graph_->resolveTargetPart(core_part_path_, *rel);
    if (!part) {
        return makeError(ErrorCode::PartNotFound, part.error().message, id);
    }
    return part;
}

const opc::PartGraph::Part& Document::getPartById(const std::string& id) const {
    return *FASTWORD_UNWRAP(findPartById(id));
}

const HeaderFooter* Document::findIn(const std::vector<std::unique_ptr<HeaderFooter>>& list,
                                     const std::string& relationship_id) {
    for (const auto& item : list) {
        if (item->getRelationshipId() == relationship_id) {
            return item.get();
        }
    }
    return nullptr;
}

const HeaderFooter* Document::findHeader(const std::string& relationship_id) const {
    return findIn(headers_, relationship_id);
}

const HeaderFooter* Document::findFooter(const std::string& relationship_id) const {
    return findIn(footers_, relationship_id);
}

}} // namespace fastword::core

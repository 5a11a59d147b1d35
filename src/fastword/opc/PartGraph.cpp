#include "fastword/utils/ModuleLoggers.hpp"
#include "fastword/opc/PartGraph.hpp"
#include "fastword/archive/ZipReader.hpp"
#include "fastword/reader/RelationshipsParser.hpp"
#include "fastword/reader/ContentTypesParser.hpp"
#include <fmt/format.h>
#include <string_view>

namespace fastword {
namespace opc {

namespace {

const std::vector<PartGraph::Relationship> kNoRelationships;

bool isIllegalUriChar(unsigned char c) {
    if (c < 0x20 || c == 0x7f) {
        return true;
    }
    switch (c) {
        case ' ': case '<': case '>': case '"': case '{': case '}':
        case '|': case '\\': case '^': case '`':
            return true;
        default:
            return false;
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hexValue(value[i + 1]);
            int lo = hexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        result.push_back(value[i]);
    }
    return result;
}

} // namespace

// ========== PartGraph 实现 ==========

PartGraph::PartGraph() = default;
PartGraph::~PartGraph() = default;

core::VoidResult PartGraph::buildFromZipReader(archive::ZipReader& reader, size_t max_part_size) {
    if (!reader.isOpen()) {
        OPC_ERROR("Invalid or closed ZipReader");
        return core::makeError(core::ErrorCode::InvalidArgument, "ZipReader is not open", reader.getPath());
    }

    std::string content_types_xml;
    if (archive::isError(reader.extractFile(core::Constants::kContentTypesPath, content_types_xml, max_part_size))) {
        return core::makeError(core::ErrorCode::InvalidPackage,
                               "Package has no [Content_Types].xml", reader.getPath());
    }

    reader::ContentTypesParser content_types;
    if (!content_types.parse(content_types_xml)) {
        return core::makeError(core::ErrorCode::InvalidPackage,
                               fmt::format("Invalid [Content_Types].xml: {}", content_types.getErrorMessage()),
                               reader.getPath());
    }

    auto files = reader.listFiles();
    OPC_DEBUG("Building part graph from {} files", files.size());

    std::vector<std::string> rels_files;
    for (const auto& file : files) {
        if (file.empty() || file.back() == '/' || file == core::Constants::kContentTypesPath) {
            continue;
        }

        std::string data;
        archive::ZipError zip_result = reader.extractFile(file, data, max_part_size);
        if (zip_result == archive::ZipError::TooLarge) {
            return core::makeError(core::ErrorCode::FileReadError,
                                   fmt::format("Part exceeds the {} byte limit", max_part_size), file);
        }
        if (archive::isError(zip_result)) {
            return core::makeError(core::ErrorCode::ZipError,
                                   fmt::format("Failed to extract part: {}", archive::toString(zip_result)), file);
        }

        if (isRelsPath(file)) {
            rels_files.push_back(file);
        }
        addPart(file, content_types.getContentType("/" + file), std::move(data));
    }

    for (const auto& rels_path : rels_files) {
        const Part* rels_part = getPart(rels_path);
        auto result = parseRels(rels_path, rels_part->data);
        if (!result) {
            return result;
        }
    }

    OPC_INFO("Part graph built with {} parts", parts_.size());
    return core::success();
}

PartGraph::Part& PartGraph::addPart(const std::string& path, const std::string& content_type, std::string data) {
    auto it = parts_.find(path);
    if (it == parts_.end()) {
        it = parts_.emplace(path, Part{}).first;
        part_order_.push_back(path);
    }
    Part& part = it->second;
    part.path = path;
    part.content_type = content_type;
    part.data = std::move(data);
    return part;
}

core::VoidResult PartGraph::addRelationship(const std::string& source, const Relationship& rel) {
    Part* part = findPart(source);
    if (!part) {
        return core::makeError(core::ErrorCode::PartNotFound,
                               fmt::format("Relationship {} has no source part", rel.id), source);
    }
    if (part->relationship_index.count(rel.id)) {
        return core::makeError(core::ErrorCode::DuplicateId,
                               fmt::format("Duplicate relationship id {}", rel.id), source);
    }

    part->relationship_index[rel.id] = part->relationships.size();
    part->relationships.push_back(rel);
    return core::success();
}

const PartGraph::Part* PartGraph::getPart(const std::string& path) const {
    auto it = parts_.find(path);
    return (it != parts_.end()) ? &it->second : nullptr;
}

const std::vector<PartGraph::Relationship>& PartGraph::getRelationships(const std::string& source) const {
    const Part* part = findSource(source);
    return part ? part->relationships : kNoRelationships;
}

std::vector<const PartGraph::Relationship*> PartGraph::getRelationshipsByType(const std::string& source,
                                                                              const std::string& type) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : getRelationships(source)) {
        if (rel.type == type) {
            result.push_back(&rel);
        }
    }
    return result;
}

const PartGraph::Relationship* PartGraph::getRelationship(const std::string& source, const std::string& id) const {
    const Part* part = findSource(source);
    if (!part) {
        return nullptr;
    }
    auto it = part->relationship_index.find(id);
    return it != part->relationship_index.end() ? &part->relationships[it->second] : nullptr;
}

core::Result<const PartGraph::Part*> PartGraph::resolveTargetPart(const std::string& source, const Relationship& rel) const {
    if (rel.isExternal()) {
        return core::makeError(core::ErrorCode::PartNotFound,
                               fmt::format("Relationship {} targets an external resource", rel.id), rel.target);
    }
    if (rel.target.empty()) {
        return core::makeError(core::ErrorCode::InvalidTargetUri,
                               fmt::format("Relationship {} has an empty target", rel.id), source);
    }

    std::string path = normalizePath(source, rel.target);
    const Part* part = getPart(path);
    if (!part) {
        // ZIP 条目名按编码形式存放，个别生成器写入的是解码后的名字
        part = getPart(percentDecode(path));
    }
    if (!part) {
        OPC_WARN("Relationship {} of '{}' points to missing part '{}'", rel.id, source, path);
        return core::makeError(core::ErrorCode::PartNotFound,
                               fmt::format("Target part of relationship {} does not exist", rel.id), path);
    }
    return part;
}

core::Result<std::string> PartGraph::resolveTargetUri(const std::string& source, const Relationship& rel) const {
    if (rel.target.empty()) {
        return core::makeError(core::ErrorCode::InvalidTargetUri,
                               fmt::format("Relationship {} has an empty target", rel.id), source);
    }
    for (char c : rel.target) {
        if (isIllegalUriChar(static_cast<unsigned char>(c))) {
            return core::makeError(core::ErrorCode::InvalidTargetUri,
                                   fmt::format("Relationship {} target is not a valid URI", rel.id), rel.target);
        }
    }

    if (rel.isExternal()) {
        return rel.target;
    }
    return "/" + normalizePath(source, rel.target);
}

core::Result<const PartGraph::Part*> PartGraph::getMainDocumentPart() const {
    auto rels = getRelationshipsByType(kPackageSource, core::Constants::kOfficeDocumentRelType);
    if (rels.empty()) {
        return core::makeError(core::ErrorCode::InvalidPackage, "Package has no officeDocument relationship");
    }
    if (rels.size() > 1) {
        OPC_WARN("Package has {} officeDocument relationships, using {}", rels.size(), rels.front()->id);
    }

    auto part = resolveTargetPart(kPackageSource, *rels.front());
    if (!part) {
        return core::makeError(core::ErrorCode::InvalidPackage,
                               fmt::format("Main document part is missing: {}", part.error().message),
                               part.error().context);
    }
    return part;
}

std::string PartGraph::getRelsPath(const std::string& part_path) {
    if (part_path.empty() || part_path == "/") {
        return core::Constants::kPackageRelsPath;
    }

    size_t last_slash = part_path.find_last_of('/');
    if (last_slash == std::string::npos) {
        return fmt::format("_rels/{}.rels", part_path);
    }

    std::string_view dir_view(part_path.data(), last_slash);
    std::string_view name_view(part_path.data() + last_slash + 1, part_path.size() - last_slash - 1);
    return fmt::format("{}/_rels/{}.rels", dir_view, name_view);
}

std::string PartGraph::getSourcePartFromRelsPath(const std::string& rels_path) {
    if (rels_path == core::Constants::kPackageRelsPath) {
        return kPackageSource;
    }

    if (!isRelsPath(rels_path)) {
        return rels_path;
    }

    const std::string marker = "_rels/";
    size_t pos = rels_path.rfind(marker);
    std::string name = rels_path.substr(pos + marker.size());
    name.resize(name.size() - 5);  // ".rels"
    return rels_path.substr(0, pos) + name;
}

bool PartGraph::isRelsPath(const std::string& path) {
    const std::string suffix = ".rels";
    if (path.size() < suffix.size() ||
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    return path.rfind("_rels/") != std::string::npos;
}

std::string PartGraph::normalizePath(const std::string& source, const std::string& target) {
    std::string combined;
    if (!target.empty() && target[0] == '/') {
        combined = target.substr(1);
    } else {
        size_t last_slash = source.find_last_of('/');
        combined = (last_slash == std::string::npos) ? target : source.substr(0, last_slash + 1) + target;
    }

    // 去掉片段标识
    size_t hash = combined.find('#');
    if (hash != std::string::npos) {
        combined.resize(hash);
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= combined.size()) {
        size_t end = combined.find('/', start);
        if (end == std::string::npos) {
            end = combined.size();
        }
        std::string segment = combined.substr(start, end - start);
        if (segment == "..") {
            if (!segments.empty()) {
                segments.pop_back();
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(std::move(segment));
        }
        start = end + 1;
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result.push_back('/');
        }
        result += segments[i];
    }
    return result;
}

PartGraph::Part* PartGraph::findPart(const std::string& source) {
    if (source.empty()) {
        return &package_;
    }
    auto it = parts_.find(source);
    return it != parts_.end() ? &it->second : nullptr;
}

const PartGraph::Part* PartGraph::findSource(const std::string& source) const {
    if (source.empty()) {
        return &package_;
    }
    return getPart(source);
}

core::VoidResult PartGraph::parseRels(const std::string& rels_path, const std::string& rels_content) {
    std::string source = getSourcePartFromRelsPath(rels_path);
    if (!source.empty() && !hasPart(source)) {
        OPC_WARN("Ignoring relationships of missing part '{}'", source);
        return core::success();
    }

    if (rels_content.empty()) {
        OPC_DEBUG("Empty rels content: {}", rels_path);
        return core::success();
    }

    reader::RelationshipsParser parser;
    if (!parser.parse(rels_content)) {
        return core::makeError(core::ErrorCode::XmlParseError,
                               fmt::format("Failed to parse relationships: {}", parser.getErrorMessage()),
                               rels_path);
    }

    for (const auto& parsed_rel : parser.getRelationships()) {
        auto result = addRelationship(source, Relationship(parsed_rel.id, parsed_rel.type,
                                                           parsed_rel.target, parsed_rel.target_mode));
        if (!result) {
            return result;
        }
    }

    OPC_DEBUG("Parsed {} relationships from {}", parser.getRelationshipCount(), rels_path);
    return core::success();
}

}} // namespace fastword::opc

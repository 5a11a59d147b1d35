#include "RelationshipsParser.hpp"
#include "fastword/utils/ModuleLoggers.hpp"

namespace fastword {
namespace reader {

void RelationshipsParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name != "Relationship" || !isInElement("Relationships")) {
        return;
    }

    auto id = findAttribute(attributes, "Id");
    auto type = findAttribute(attributes, "Type");
    std::string target = getAttributeOr(attributes, "Target", "");
    std::string target_mode = getAttributeOr(attributes, "TargetMode", "");

    if (!id || !type || id->empty() || type->empty()) {
        READER_WARN("Skipping incomplete relationship: id='{}', type='{}'",
                    id ? *id : "", type ? *type : "");
        return;
    }

    if (id_index_.count(*id)) {
        READER_WARN("Duplicate relationship id '{}', keeping the first declaration", *id);
        return;
    }

    if (target.empty()) {
        READER_WARN("Relationship '{}' has an empty target", *id);
    }

    Relationship rel;
    rel.id = *id;
    rel.type = *type;
    rel.target = std::move(target);
    rel.target_mode = target_mode.empty() ? "Internal" : std::move(target_mode);

    id_index_[rel.id] = relationships_.size();
    READER_DEBUG("Parsed relationship: {} -> {} ({})", rel.id, rel.target, rel.type);
    relationships_.push_back(std::move(rel));
}

const RelationshipsParser::Relationship* RelationshipsParser::findById(const std::string& id) const {
    auto it = id_index_.find(id);
    if (it != id_index_.end() && it->second < relationships_.size()) {
        return &relationships_[it->second];
    }
    return nullptr;
}

std::vector<const RelationshipsParser::Relationship*> RelationshipsParser::findByType(const std::string& type) const {
    std::vector<const Relationship*> result;
    for (const auto& rel : relationships_) {
        if (rel.type == type) {
            result.push_back(&rel);
        }
    }
    return result;
}

}} // namespace fastword::reader

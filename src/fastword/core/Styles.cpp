#include "fastword/core/Styles.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <unordered_set>

namespace fastword {
namespace core {

namespace {

std::string childValue(const xml::XMLElement& style, const char* child_name) {
    const xml::XMLElement* child = style.findChild(Constants::kWordprocessingNS, child_name);
    return child ? child->getAttribute(Constants::kWordprocessingNS, "val") : "";
}

bool isOn(const std::string& value) {
    return value == "1" || value == "true" || value == "on";
}

} // namespace

Styles::Styles(std::unique_ptr<xml::XMLElement> root) : root_(std::move(root)) {
    for (const xml::XMLElement* node : root_->findChildren(Constants::kWordprocessingNS, "style")) {
        Style style;
        style.id = node->getAttribute(Constants::kWordprocessingNS, "styleId");
        style.type = node->getAttribute(Constants::kWordprocessingNS, "type", "paragraph");
        style.name = childValue(*node, "name");
        style.based_on = childValue(*node, "basedOn");
        style.next = childValue(*node, "next");
        style.link = childValue(*node, "link");
        style.is_default = isOn(node->getAttribute(Constants::kWordprocessingNS, "default"));
        style.is_custom = isOn(node->getAttribute(Constants::kWordprocessingNS, "customStyle"));

        if (style.id.empty()) {
            CORE_WARN("Skipping style without w:styleId");
            continue;
        }
        if (style_index_.count(style.id)) {
            CORE_WARN("Duplicate style id '{}', keeping the first definition", style.id);
            continue;
        }

        style_index_[style.id] = styles_.size();
        styles_.push_back(std::move(style));
    }
    CORE_DEBUG("Loaded {} styles", styles_.size());
}

const Style* Styles::getStyle(const std::string& style_id) const {
    auto it = style_index_.find(style_id);
    return it != style_index_.end() ? &styles_[it->second] : nullptr;
}

std::string Styles::getDefaultStyleId(const std::string& type) const {
    for (const auto& style : styles_) {
        if (style.is_default && style.type == type) {
            return style.id;
        }
    }
    return "";
}

std::vector<const Style*> Styles::getStyleChain(const std::string& style_id) const {
    std::vector<const Style*> chain;
    std::unordered_set<std::string> seen;

    const Style* current = getStyle(style_id);
    while (current && seen.insert(current->id).second) {
        chain.push_back(current);
        current = current->based_on.empty() ? nullptr : getStyle(current->based_on);
    }
    return chain;
}

std::vector<const Style*> Styles::getUsedStyleList(const std::string& style_id) const {
    std::vector<const Style*> used;
    std::vector<const Style*> pending;

    if (const Style* start = getStyle(style_id)) {
        pending.push_back(start);
    }

    while (!pending.empty()) {
        const Style* style = pending.back();
        pending.pop_back();
        if (std::find(used.begin(), used.end(), style) != used.end()) {
            continue;
        }
        used.push_back(style);

        for (const std::string* ref : {&style->based_on, &style->next, &style->link}) {
            if (ref->empty()) {
                continue;
            }
            if (const Style* target = getStyle(*ref)) {
                pending.push_back(target);
            }
        }
    }
    return used;
}

std::string Styles::getStyleIdByName(const std::string& name) const {
    for (const auto& style : styles_) {
        if (style.name == name) {
            return style.id;
        }
    }
    return "";
}

}} // namespace fastword::core

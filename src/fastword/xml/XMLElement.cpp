#include "fastword/xml/XMLElement.hpp"

namespace fastword {
namespace xml {

XMLElement::XMLElement(const std::string& qualified_name) : name(qualified_name) {
    auto [ns, local] = splitName(qualified_name);
    namespace_uri.assign(ns);
    local_name.assign(local);
}

std::pair<std::string_view, std::string_view> XMLElement::splitName(std::string_view qualified_name) {
    size_t pos = qualified_name.rfind(kNamespaceSeparator);
    if (pos == std::string_view::npos) {
        return {std::string_view{}, qualified_name};
    }
    return {qualified_name.substr(0, pos), qualified_name.substr(pos + 1)};
}

std::string XMLElement::makeKey(std::string_view namespace_uri, std::string_view local_name) {
    if (namespace_uri.empty()) {
        return std::string(local_name);
    }
    std::string key;
    key.reserve(namespace_uri.size() + local_name.size() + 1);
    key.append(namespace_uri);
    key.push_back(kNamespaceSeparator);
    key.append(local_name);
    return key;
}

const XMLElement* XMLElement::findChild(std::string_view ns, std::string_view local) const {
    for (const auto& child : children) {
        if (child->is(ns, local)) {
            return child.get();
        }
    }
    return nullptr;
}

std::vector<const XMLElement*> XMLElement::findChildren(std::string_view ns, std::string_view local) const {
    std::vector<const XMLElement*> result;
    for (const auto& child : children) {
        if (child->is(ns, local)) {
            result.push_back(child.get());
        }
    }
    return result;
}

const XMLElement* XMLElement::findChild(const std::string& qualified_name) const {
    for (const auto& child : children) {
        if (child->name == qualified_name) {
            return child.get();
        }
    }
    return nullptr;
}

std::optional<std::string> XMLElement::findAttribute(std::string_view ns, std::string_view local) const {
    auto it = attributes.find(makeKey(ns, local));
    if (it == attributes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string XMLElement::getAttribute(std::string_view ns, std::string_view local, const std::string& default_value) const {
    auto value = findAttribute(ns, local);
    return value ? *value : default_value;
}

std::string XMLElement::getRawAttribute(const std::string& key, const std::string& default_value) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : default_value;
}

std::string XMLElement::getInnerText() const {
    std::string result = text;
    for (const auto& child : children) {
        result += child->getInnerText();
        result += child->tail;
    }
    return result;
}

XMLElement* XMLElement::appendChild(const std::string& qualified_name) {
    auto child = std::make_unique<XMLElement>(qualified_name);
    XMLElement* child_ptr = child.get();
    child_ptr->parent = this;
    children.push_back(std::move(child));
    return child_ptr;
}

void XMLElement::visitDescendants(const std::function<bool(const XMLElement&)>& visitor) const {
    for (const auto& child : children) {
        if (visitor(*child)) {
            child->visitDescendants(visitor);
        }
    }
}

int XMLElement::getDepth() const {
    int depth = 0;
    for (const XMLElement* current = parent; current; current = current->parent) {
        depth++;
    }
    return depth;
}

}} // namespace fastword::xml

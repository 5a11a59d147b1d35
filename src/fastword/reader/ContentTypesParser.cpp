#include "ContentTypesParser.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cctype>

namespace fastword {
namespace reader {

void ContentTypesParser::onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int /*depth*/) {
    if (name == "Default") {
        auto extension = findAttribute(attributes, "Extension");
        auto content_type = findAttribute(attributes, "ContentType");

        if (extension && content_type && !extension->empty() && !content_type->empty()) {
            default_index_[toLower(*extension)] = *content_type;
            READER_DEBUG("Parsed default type: .{} -> {}", *extension, *content_type);
            defaults_.push_back({std::move(*extension), std::move(*content_type)});
        } else {
            READER_WARN("Skipping incomplete default type: extension='{}', contentType='{}'",
                        extension ? *extension : "", content_type ? *content_type : "");
        }
    }
    else if (name == "Override") {
        auto part_name = findAttribute(attributes, "PartName");
        auto content_type = findAttribute(attributes, "ContentType");

        if (part_name && content_type && !part_name->empty() && !content_type->empty()) {
            override_index_[toPartKey(*part_name)] = *content_type;
            READER_DEBUG("Parsed override type: {} -> {}", *part_name, *content_type);
            overrides_.push_back({std::move(*part_name), std::move(*content_type)});
        } else {
            READER_WARN("Skipping incomplete override type: partName='{}', contentType='{}'",
                        part_name ? *part_name : "", content_type ? *content_type : "");
        }
    }
    // 忽略 <Types> 根元素
}

std::string ContentTypesParser::findDefaultType(const std::string& extension) const {
    auto it = default_index_.find(toLower(extension));
    return (it != default_index_.end()) ? it->second : std::string();
}

std::string ContentTypesParser::findOverrideType(const std::string& part_name) const {
    auto it = override_index_.find(toPartKey(part_name));
    return (it != override_index_.end()) ? it->second : std::string();
}

std::string ContentTypesParser::getContentType(const std::string& part_name) const {
    std::string override_type = findOverrideType(part_name);
    if (!override_type.empty()) {
        return override_type;
    }

    size_t last_dot = part_name.find_last_of('.');
    size_t last_slash = part_name.find_last_of('/');
    if (last_dot != std::string::npos && (last_slash == std::string::npos || last_dot > last_slash)) {
        std::string default_type = findDefaultType(part_name.substr(last_dot + 1));
        if (!default_type.empty()) {
            return default_type;
        }
    }

    return core::Constants::kOctetStreamContentType;
}

void ContentTypesParser::clear() {
    defaults_.clear();
    overrides_.clear();
    default_index_.clear();
    override_index_.clear();
}

std::string ContentTypesParser::toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string ContentTypesParser::toPartKey(const std::string& part_name) {
    if (!part_name.empty() && part_name.front() == '/') {
        return toLower(part_name.substr(1));
    }
    return toLower(part_name);
}

}} // namespace fastword::reader

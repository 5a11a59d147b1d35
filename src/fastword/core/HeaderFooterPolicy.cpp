#include "fastword/core/HeaderFooterPolicy.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/core/Document.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastword {
namespace core {

namespace {

bool parseType(const std::string& value, HeaderFooterType& type) {
    if (value.empty() || value == "default") {
        type = HeaderFooterType::Default;
    } else if (value == "first") {
        type = HeaderFooterType::First;
    } else if (value == "even") {
        type = HeaderFooterType::Even;
    } else {
        return false;
    }
    return true;
}

bool isOnOff(const xml::XMLElement& element) {
    auto val = element.findAttribute(Constants::kWordprocessingNS, "val");
    if (!val) {
        return true;
    }
    return *val == "1" || *val == "true" || *val == "on";
}

} // namespace

Result<std::unique_ptr<HeaderFooterPolicy>> HeaderFooterPolicy::create(const Document& document,
                                                                        std::vector<Diagnostic>& diagnostics) {
    std::unique_ptr<HeaderFooterPolicy> policy(new HeaderFooterPolicy());
    const bool strict = document.getOptions().policy == AssemblyPolicy::Strict;

    auto sections = document.getDocumentBody().findChildren(Constants::kWordprocessingNS, "sectPr");
    if (sections.empty()) {
        CORE_DEBUG("Document body has no section properties");
        return std::move(policy);
    }

    const xml::XMLElement& sect_pr = *sections.back();
    policy->has_section_ = true;
    if (const xml::XMLElement* title_pg = sect_pr.findChild(Constants::kWordprocessingNS, "titlePg")) {
        policy->title_page_ = isOnOff(*title_pg);
    }

    for (const auto& child : sect_pr.children) {
        HeaderFooterKind kind;
        if (child->is(Constants::kWordprocessingNS, "headerReference")) {
            kind = HeaderFooterKind::Header;
        } else if (child->is(Constants::kWordprocessingNS, "footerReference")) {
            kind = HeaderFooterKind::Footer;
        } else {
            continue;
        }

        const char* item = kind == HeaderFooterKind::Header ? "header" : "footer";
        std::string rel_id = child->getAttribute(Constants::kRelationshipsNS, "id");
        std::string type_value = child->getAttribute(Constants::kWordprocessingNS, "type");

        HeaderFooterType type;
        if (!parseType(type_value, type)) {
            CORE_WARN("Ignoring {} reference {} with unknown type '{}'", item, rel_id, type_value);
            continue;
        }

        const HeaderFooter* target = kind == HeaderFooterKind::Header
            ? document.findHeader(rel_id)
            : document.findFooter(rel_id);

        if (!target) {
            std::string message = fmt::format("{} reference '{}' does not resolve to a loaded {} part",
                                              item, rel_id, item);
            if (strict) {
                return makeError(ErrorCode::PerItemResolutionFailure, message, rel_id);
            }
            CORE_WARN("{}", message);
            diagnostics.emplace_back(ErrorCode::PerItemResolutionFailure, item, rel_id, message);
            continue;
        }

        if (kind == HeaderFooterKind::Header) {
            policy->headers_[index(type)] = target;
        } else {
            policy->footers_[index(type)] = target;
        }
    }

    return std::move(policy);
}

const HeaderFooter* HeaderFooterPolicy::select(const HeaderFooter* default_variant, const HeaderFooter* first_variant,
                                               const HeaderFooter* even_variant, int page) const {
    if (page < 1) {
        return nullptr;
    }
    if (page == 1 && title_page_ && first_variant) {
        return first_variant;
    }
    if (page % 2 == 0 && even_variant) {
        return even_variant;
    }
    return default_variant;
}

const HeaderFooter* HeaderFooterPolicy::getHeader(int page) const {
    return select(getDefaultHeader(), getFirstPageHeader(), getEvenPageHeader(), page);
}

const HeaderFooter* HeaderFooterPolicy::getFooter(int page) const {
    return select(getDefaultFooter(), getFirstPageFooter(), getEvenPageFooter(), page);
}

}} // namespace fastword::core

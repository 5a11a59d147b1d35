#include "fastword/core/BodyElement.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/core/Paragraph.hpp"
#include "fastword/core/Table.hpp"

namespace fastword {
namespace core {

std::vector<std::unique_ptr<IBodyElement>> collectBodyElements(const xml::XMLElement& container,
                                                                const Document* document) {
    std::vector<std::unique_ptr<IBodyElement>> elements;
    for (const auto& child : container.children) {
        if (child->namespace_uri != Constants::kWordprocessingNS) {
            continue;
        }
        if (child->local_name == "p") {
            elements.push_back(std::make_unique<Paragraph>(*child, document));
        } else if (child->local_name == "tbl") {
            elements.push_back(std::make_unique<Table>(*child, document));
        }
        // w:sectPr、w:sdt、书签等不是块级元素
    }
    return elements;
}

}} // namespace fastword::core

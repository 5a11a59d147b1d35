#include "WordMLParser.hpp"
#include "fastword/core/Constants.hpp"
#include "fastword/xml/XMLStreamReader.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace fastword {
namespace reader {

const char* toString(SchemaKind kind) noexcept {
    switch (kind) {
        case SchemaKind::Document: return "document";
        case SchemaKind::Styles:   return "styles";
        case SchemaKind::Comments: return "comments";
        case SchemaKind::Header:   return "header";
        case SchemaKind::Footer:   return "footer";
    }
    return "unknown";
}

const char* WordMLParser::rootElementName(SchemaKind kind) noexcept {
    switch (kind) {
        case SchemaKind::Document: return "document";
        case SchemaKind::Styles:   return "styles";
        case SchemaKind::Comments: return "comments";
        case SchemaKind::Header:   return "hdr";
        case SchemaKind::Footer:   return "ftr";
    }
    return "";
}

core::Result<std::unique_ptr<xml::XMLElement>> WordMLParser::parse(const std::string& bytes, SchemaKind kind) const {
    if (bytes.empty()) {
        return core::makeError(core::ErrorCode::XmlParseError,
                               fmt::format("Empty {} part", toString(kind)));
    }

    xml::XMLStreamReader reader;
    reader.setNamespaceAware(true);
    reader.setTrimWhitespace(false);

    auto dom = reader.parseToDOM(bytes);
    if (!dom) {
        READER_ERROR("Failed to parse {} part: {}", toString(kind), dom.error().message);
        return dom.error();
    }

    const xml::XMLElement& root = *dom.value();
    const char* expected = rootElementName(kind);
    if (!root.is(core::Constants::kWordprocessingNS, expected)) {
        READER_ERROR("Unexpected root element '{}' for {} part", root.name, toString(kind));
        return core::makeError(core::ErrorCode::SchemaMismatch,
                               fmt::format("Expected w:{} root element but found '{}'", expected, root.name));
    }

    READER_DEBUG("Parsed {} part: {} top-level elements", toString(kind), root.getChildCount());
    return dom;
}

}} // namespace fastword::reader

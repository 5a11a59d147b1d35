#include "fastword/xml/XMLStreamReader.hpp"
#include "fastword/utils/ModuleLoggers.hpp"
#include <algorithm>
#include <cstring>
#include <fmt/format.h>

namespace fastword {
namespace xml {

XMLStreamReader::XMLStreamReader() {
    attribute_pool_.reserve(32);
    resetState();
}

XMLStreamReader::~XMLStreamReader() {
    cleanupParser();
}

bool XMLStreamReader::initializeParser() {
    cleanupParser();

    if (namespace_aware_) {
        parser_ = XML_ParserCreateNS(nullptr, XMLElement::kNamespaceSeparator);
    } else {
        parser_ = XML_ParserCreate(nullptr);
    }

    if (!parser_) {
        handleError(XMLParseError::ParserCreateFailed, "Failed to create XML parser");
        return false;
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, startElementHandler, endElementHandler);
    XML_SetCharacterDataHandler(parser_, characterDataHandler);
    return true;
}

void XMLStreamReader::cleanupParser() {
    if (parser_) {
        XML_ParserFree(parser_);
        parser_ = nullptr;
    }
}

void XMLStreamReader::resetState() {
    is_parsing_ = false;
    current_depth_ = 0;
    last_error_ = XMLParseError::Ok;
    last_error_message_.clear();
    attribute_pool_.clear();
    current_text_.clear();
    bytes_parsed_ = 0;
    elements_parsed_ = 0;
}

void XMLStreamReader::setStartElementCallback(StartElementCallback callback) {
    start_element_callback_ = std::move(callback);
}

void XMLStreamReader::setEndElementCallback(EndElementCallback callback) {
    end_element_callback_ = std::move(callback);
}

void XMLStreamReader::setTextCallback(TextCallback callback) {
    text_callback_ = std::move(callback);
}

void XMLStreamReader::setTrimWhitespace(bool trim) {
    trim_whitespace_ = trim;
}

void XMLStreamReader::setNamespaceAware(bool aware) {
    namespace_aware_ = aware;
}

XMLParseError XMLStreamReader::parseFromString(const std::string& xml_content) {
    return parseFromBuffer(xml_content.data(), xml_content.size());
}

XMLParseError XMLStreamReader::parseFromBuffer(const char* buffer, size_t size) {
    if (!buffer || size == 0) {
        handleError(XMLParseError::InvalidInput, "Invalid buffer or size");
        return XMLParseError::InvalidInput;
    }

    XMLParseError result = beginParsing();
    if (isError(result)) {
        return result;
    }

    result = feedData(buffer, size);
    if (isError(result)) {
        is_parsing_ = false;
        return result;
    }

    return endParsing();
}

XMLParseError XMLStreamReader::beginParsing() {
    resetState();
    if (!initializeParser()) {
        return last_error_;
    }
    is_parsing_ = true;
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::feedData(const char* data, size_t size) {
    if (!parser_ || !is_parsing_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }

    // 按块拷贝进expat缓冲区，避免超大部件的 int 溢出
    size_t offset = 0;
    while (offset < size) {
        size_t chunk = std::min(size - offset, core::Constants::kIOBufferSize);
        XMLParseError result = feedBuffer(data + offset, chunk, false);
        if (isError(result)) {
            return result;
        }
        offset += chunk;
    }
    return XMLParseError::Ok;
}

XMLParseError XMLStreamReader::endParsing() {
    if (!parser_ || !is_parsing_) {
        handleError(XMLParseError::ParserCreateFailed, "Parser not initialized");
        return XMLParseError::ParserCreateFailed;
    }

    XMLParseError result = feedBuffer(nullptr, 0, true);
    is_parsing_ = false;
    if (isSuccess(result)) {
        XML_DEBUG("Successfully parsed {} bytes, {} elements", bytes_parsed_, elements_parsed_);
    }
    return result;
}

XMLParseError XMLStreamReader::feedBuffer(const char* data, size_t size, bool is_final) {
    void* expat_buffer = XML_GetBuffer(parser_, static_cast<int>(size));
    if (!expat_buffer) {
        handleError(XMLParseError::MemoryError, "Failed to get Expat buffer");
        return XMLParseError::MemoryError;
    }
    if (size > 0) {
        std::memcpy(expat_buffer, data, size);
    }
    bytes_parsed_ += size;

    if (XML_ParseBuffer(parser_, static_cast<int>(size), is_final ? 1 : 0) == XML_STATUS_ERROR) {
        // 回调中止时错误已经记录
        if (last_error_ == XMLParseError::CallbackError || last_error_ == XMLParseError::TooDeep) {
            return last_error_;
        }
        std::string error_msg = fmt::format("Parse error at line {}, column {}: {}",
            XML_GetCurrentLineNumber(parser_),
            XML_GetCurrentColumnNumber(parser_),
            XML_ErrorString(XML_GetErrorCode(parser_)));
        handleError(XMLParseError::ParseFailed, error_msg);
        return XMLParseError::ParseFailed;
    }
    return XMLParseError::Ok;
}

void XMLCALL XMLStreamReader::startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs) {
    auto* reader = static_cast<XMLStreamReader*>(userData);

    if (static_cast<size_t>(reader->current_depth_) >= MAX_DEPTH) {
        reader->handleError(XMLParseError::TooDeep,
                            fmt::format("Element nesting exceeds {} levels", MAX_DEPTH));
        XML_StopParser(reader->parser_, XML_FALSE);
        return;
    }

    // 子元素之前的文本属于父元素
    if (!reader->flushText(reader->current_depth_ - 1)) {
        return;
    }

    std::string_view element_name{name, std::strlen(name)};
    reader->elements_parsed_++;
    reader->parseAttributes(attrs);

    if (reader->start_element_callback_) {
        try {
            reader->start_element_callback_(element_name, reader->attribute_pool_, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("Start element", e);
            return;
        }
    }

    reader->current_depth_++;
}

void XMLCALL XMLStreamReader::endElementHandler(void* userData, const XML_Char* name) {
    auto* reader = static_cast<XMLStreamReader*>(userData);

    reader->current_depth_--;
    std::string_view element_name{name, std::strlen(name)};

    if (!reader->flushText(reader->current_depth_)) {
        return;
    }

    if (reader->end_element_callback_) {
        try {
            reader->end_element_callback_(element_name, reader->current_depth_);
        } catch (const std::exception& e) {
            reader->abortFromCallback("End element", e);
            return;
        }
    }

}

void XMLCALL XMLStreamReader::characterDataHandler(void* userData, const XML_Char* data, int len) {
    auto* reader = static_cast<XMLStreamReader*>(userData);
    if (len > 0) {
        reader->current_text_.append(data, static_cast<size_t>(len));
    }
}

bool XMLStreamReader::flushText(int depth) {
    if (current_text_.empty()) {
        return true;
    }

    bool ok = true;
    if (text_callback_) {
        std::string_view text_content = trim_whitespace_ ?
            trimStringView(current_text_) : std::string_view{current_text_};

        if (!text_content.empty()) {
            try {
                text_callback_(text_content, depth);
            } catch (const std::exception& e) {
                abortFromCallback("Text", e);
                ok = false;
            }
        }
    }
    current_text_.clear();
    return ok;
}

void XMLStreamReader::parseAttributes(const XML_Char** attrs) {
    attribute_pool_.clear();
    if (!attrs) {
        return;
    }
    for (int i = 0; attrs[i]; i += 2) {
        if (attrs[i + 1]) {
            attribute_pool_.emplace_back(
                std::string_view{attrs[i], std::strlen(attrs[i])},
                std::string_view{attrs[i + 1], std::strlen(attrs[i + 1])});
        }
    }
}

std::string_view XMLStreamReader::trimStringView(std::string_view str) const {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) {
        return std::string_view{};
    }
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

void XMLStreamReader::handleError(XMLParseError error, const std::string& message) {
    last_error_ = error;
    last_error_message_ = message;
    XML_ERROR("XML parse error: {}", message);
}

void XMLStreamReader::abortFromCallback(const char* stage, const std::exception& e) {
    handleError(XMLParseError::CallbackError, fmt::format("{} callback error: {}", stage, e.what()));
    XML_StopParser(parser_, XML_FALSE);
}

core::Result<std::unique_ptr<XMLElement>> XMLStreamReader::parseToDOM(const std::string& xml_content) {
    return parseToDOM(xml_content.data(), xml_content.size());
}

core::Result<std::unique_ptr<XMLElement>> XMLStreamReader::parseToDOM(const char* buffer, size_t size) {
    std::unique_ptr<XMLElement> root;
    std::vector<XMLElement*> element_stack;
    std::string pending_text;

    // 文本接在最后一个子元素之后（tail），没有子元素时归入元素自身
    auto attach_text = [&](bool child_follows) {
        if (pending_text.empty() || element_stack.empty()) {
            pending_text.clear();
            return;
        }
        XMLElement* current = element_stack.back();
        bool blank = pending_text.find_first_not_of(" \t\n\r") == std::string::npos;
        // 元素之间的格式化空白
        if (blank && (child_follows || current->hasChildren())) {
            pending_text.clear();
            return;
        }
        if (current->hasChildren()) {
            current->children.back()->tail.append(pending_text);
        } else {
            current->text.append(pending_text);
        }
        pending_text.clear();
    };

    setStartElementCallback([&](std::string_view element_name, const std::vector<XMLAttribute>& attributes, int /*depth*/) {
        attach_text(true);
        XMLElement* element_ptr = nullptr;
        if (element_stack.empty()) {
            root = std::make_unique<XMLElement>(std::string(element_name));
            element_ptr = root.get();
        } else {
            element_ptr = element_stack.back()->appendChild(std::string(element_name));
        }

        for (const auto& attr : attributes) {
            element_ptr->attributes[std::string(attr.name)] = std::string(attr.value);
        }
        element_stack.push_back(element_ptr);
    });

    setEndElementCallback([&](std::string_view /*element_name*/, int /*depth*/) {
        attach_text(false);
        if (!element_stack.empty()) {
            element_stack.pop_back();
        }
    });

    setTextCallback([&](std::string_view text, int /*depth*/) {
        pending_text.append(text);
    });

    XMLParseError result = parseFromBuffer(buffer, size);

    setStartElementCallback(nullptr);
    setEndElementCallback(nullptr);
    setTextCallback(nullptr);

    if (isError(result)) {
        return core::makeError(core::ErrorCode::XmlParseError,
                               fmt::format("Failed to parse XML to DOM: {}", last_error_message_));
    }
    if (!root) {
        return core::makeError(core::ErrorCode::XmlParseError, "XML document has no root element");
    }
    return std::move(root);
}

}} // namespace fastword::xml

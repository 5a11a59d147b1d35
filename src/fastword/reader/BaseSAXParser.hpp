#pragma once

#include "fastword/xml/XMLStreamReader.hpp"
#include "fastword/utils/Logger.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace fastword {
namespace reader {

/**
 * @brief 通用SAX解析器基类
 *
 * 为包元数据（[Content_Types].xml、*.rels）等扁平XML提供事件驱动解析：
 * - 底层是开启命名空间解析的 XMLStreamReader
 * - 子类收到的元素名已去掉命名空间，只剩本地名
 * - 元素栈跟踪当前所在位置
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            has_error = false;
            error_message.clear();
        }

        bool isInElement(std::string_view element_name) const {
            for (const auto& name : element_stack) {
                if (name == element_name) return true;
            }
            return false;
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @param xml_content XML字符串内容
     * @return 是否解析成功，失败原因见 getErrorMessage()
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setNamespaceAware(true);

        reader.setStartElementCallback([this](std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
            handleStartElement(localName(name), attributes, depth);
        });

        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(localName(name), depth);
        });

        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        auto result = reader.parseFromString(xml_content);
        if (xml::isError(result)) {
            if (!state_.has_error) {
                setError(reader.getLastErrorMessage());
            }
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void handleStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) {
        state_.element_stack.emplace_back(name);
        onStartElement(name, attributes, depth);
    }

    virtual void handleEndElement(std::string_view name, int depth) {
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        onEndElement(name, depth);
    }

    virtual void handleText(std::string_view text, int depth) {
        onText(text, depth);
    }

    // 子类重写的虚函数
    virtual void onStartElement(std::string_view name, const std::vector<xml::XMLAttribute>& attributes, int depth) = 0;
    virtual void onEndElement(std::string_view /*name*/, int /*depth*/) {}
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 通用工具方法 ====================

    static std::string_view localName(std::string_view name) {
        size_t pos = name.rfind(xml::XMLElement::kNamespaceSeparator);
        return pos == std::string_view::npos ? name : name.substr(pos + 1);
    }

    /**
     * @brief 按本地名查找属性（无前缀属性没有命名空间）
     */
    std::optional<std::string> findAttribute(const std::vector<xml::XMLAttribute>& attributes, std::string_view name) const {
        for (const auto& attr : attributes) {
            if (localName(attr.name) == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    std::string getAttributeOr(const std::vector<xml::XMLAttribute>& attributes, std::string_view name, const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        FASTWORD_LOG_ERROR("Parser Error: {}", message);
    }

    bool isInElement(std::string_view element_name) const { return state_.isInElement(element_name); }
};

}} // namespace fastword::reader

#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <functional>
#include <expat.h>

#include "fastword/core/Constants.hpp"
#include "fastword/core/Expected.hpp"
#include "fastword/core/ErrorCode.hpp"
#include "fastword/xml/XMLElement.hpp"

namespace fastword {
namespace xml {

/**
 * @brief 基于libexpat的流式XML解析器
 *
 * - SAX事件回调（开始元素、结束元素、文本）
 * - 可选命名空间解析，名称形式为 "uri|local"
 * - 支持从内存缓冲区一次性解析或分块喂入
 * - 回调抛出的异常会中止解析并以 CallbackError 返回
 */

// 解析错误枚举
enum class XMLParseError {
    Ok,                    // 解析成功
    InvalidInput,          // 无效输入
    ParserCreateFailed,    // 解析器创建失败
    ParseFailed,           // 解析失败
    MemoryError,           // 内存错误
    CallbackError,         // 回调函数错误
    TooDeep                // 嵌套超过上限
};

constexpr bool isSuccess(XMLParseError error) noexcept {
    return error == XMLParseError::Ok;
}

constexpr bool isError(XMLParseError error) noexcept {
    return error != XMLParseError::Ok;
}

// XML属性（指向expat内部缓冲区，仅在回调期间有效）
struct XMLAttribute {
    std::string_view name;
    std::string_view value;

    XMLAttribute(std::string_view n, std::string_view v) : name(n), value(v) {}
};

class XMLStreamReader {
public:
    using StartElementCallback = std::function<void(std::string_view name, const std::vector<XMLAttribute>& attributes, int depth)>;
    using EndElementCallback = std::function<void(std::string_view name, int depth)>;
    using TextCallback = std::function<void(std::string_view text, int depth)>;

    static constexpr size_t MAX_DEPTH = 256;  // 最大嵌套深度

    XMLStreamReader();
    ~XMLStreamReader();

    XMLStreamReader(const XMLStreamReader&) = delete;
    XMLStreamReader& operator=(const XMLStreamReader&) = delete;

    // 回调函数设置
    void setStartElementCallback(StartElementCallback callback);
    void setEndElementCallback(EndElementCallback callback);
    void setTextCallback(TextCallback callback);

    // 解析选项设置
    void setTrimWhitespace(bool trim);
    void setNamespaceAware(bool aware);
    bool isNamespaceAware() const { return namespace_aware_; }

    // 解析方法
    XMLParseError parseFromString(const std::string& xml_content);
    XMLParseError parseFromBuffer(const char* buffer, size_t size);

    // 分块解析
    XMLParseError beginParsing();
    XMLParseError feedData(const char* data, size_t size);
    XMLParseError endParsing();

    // 状态查询
    bool isParsing() const { return is_parsing_; }
    XMLParseError getLastError() const { return last_error_; }
    const std::string& getLastErrorMessage() const { return last_error_message_; }
    int getCurrentDepth() const { return current_depth_; }
    size_t getElementsParsed() const { return elements_parsed_; }

    /**
     * @brief 把整个文档解析成DOM树（适合部件级别的小文档）
     *
     * 只有不含子元素的节点保留纯空白文本，元素之间的缩进空白会被丢弃。
     * 子元素之后的文本记在该子元素的 tail 上。
     * @return 根元素，或带行列信息的 XmlParseError
     */
    core::Result<std::unique_ptr<XMLElement>> parseToDOM(const std::string& xml_content);
    core::Result<std::unique_ptr<XMLElement>> parseToDOM(const char* buffer, size_t size);

private:
    // libexpat回调函数（静态）
    static void XMLCALL startElementHandler(void* userData, const XML_Char* name, const XML_Char** attrs);
    static void XMLCALL endElementHandler(void* userData, const XML_Char* name);
    static void XMLCALL characterDataHandler(void* userData, const XML_Char* data, int len);

    bool initializeParser();
    void cleanupParser();
    void resetState();
    XMLParseError feedBuffer(const char* data, size_t size, bool is_final);
    bool flushText(int depth);  // 向文本回调交付缓冲文本，回调抛异常时返回 false
    void parseAttributes(const XML_Char** attrs);
    std::string_view trimStringView(std::string_view str) const;
    void handleError(XMLParseError error, const std::string& message);
    void abortFromCallback(const char* stage, const std::exception& e);

    XML_Parser parser_ = nullptr;

    bool is_parsing_ = false;
    int current_depth_ = 0;
    XMLParseError last_error_ = XMLParseError::Ok;
    std::string last_error_message_;

    std::vector<XMLAttribute> attribute_pool_;
    std::string current_text_;

    StartElementCallback start_element_callback_;
    EndElementCallback end_element_callback_;
    TextCallback text_callback_;

    bool trim_whitespace_ = true;
    bool namespace_aware_ = false;

    size_t bytes_parsed_ = 0;
    size_t elements_parsed_ = 0;
};

}} // namespace fastword::xml

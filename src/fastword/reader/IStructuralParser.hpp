#pragma once

#include "fastword/core/Expected.hpp"
#include "fastword/xml/XMLElement.hpp"
#include <memory>
#include <string>

namespace fastword {
namespace reader {

/**
 * @brief 部件的结构模式
 */
enum class SchemaKind {
    Document,   // w:document
    Styles,     // w:styles
    Comments,   // w:comments
    Header,     // w:hdr
    Footer      // w:ftr
};

const char* toString(SchemaKind kind) noexcept;

/**
 * @brief 结构化解析器接口
 *
 * 把部件字节解析成元素树，并校验根元素与声明的模式一致。
 * 实现必须可在多个线程里同时调用（样式延迟解析会并发进入）。
 */
class IStructuralParser {
public:
    virtual ~IStructuralParser() = default;

    /**
     * @brief 解析部件
     * @param bytes 部件的原始字节
     * @param kind 期望的模式
     * @return 根元素；XML损坏时为 XmlParseError，根元素不符时为 SchemaMismatch
     */
    virtual core::Result<std::unique_ptr<xml::XMLElement>> parse(const std::string& bytes, SchemaKind kind) const = 0;
};

}} // namespace fastword::reader

#pragma once

#include "IStructuralParser.hpp"

namespace fastword {
namespace reader {

/**
 * @brief 默认的 WordprocessingML 解析器
 *
 * 每次调用都创建独立的 XMLStreamReader，因此本身无状态、线程安全。
 * 文本不做裁剪，w:t 里的空格原样保留。
 */
class WordMLParser : public IStructuralParser {
public:
    WordMLParser() = default;
    ~WordMLParser() override = default;

    core::Result<std::unique_ptr<xml::XMLElement>> parse(const std::string& bytes, SchemaKind kind) const override;

    /**
     * @brief 模式对应的根元素本地名
     */
    static const char* rootElementName(SchemaKind kind) noexcept;
};

}} // namespace fastword::reader

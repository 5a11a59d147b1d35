#pragma once

#include "fastword/core/ErrorCode.hpp"
#include <fmt/format.h>
#include <string>

namespace fastword {
namespace core {

/**
 * @brief 装配期间的逐项诊断
 *
 * 宽松策略下，单个超链接、嵌入对象、页眉页脚或批注的失败不会中止装配，
 * 而是记录在 Document::getDiagnostics() 里。
 */
struct Diagnostic {
    ErrorCode code = ErrorCode::Ok;
    std::string item;             // 条目类别，如 "hyperlink"、"embed"
    std::string relationship_id;  // 相关关系ID（批注重复时为批注ID）
    std::string message;

    Diagnostic() = default;
    Diagnostic(ErrorCode c, std::string item_kind, std::string id, std::string msg)
        : code(c), item(std::move(item_kind)), relationship_id(std::move(id)), message(std::move(msg)) {}

    std::string toString() const {
        return fmt::format("[{}] {} {}: {}", core::toString(code), item, relationship_id, message);
    }
};

}} // namespace fastword::core

#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace fastword {
namespace core {

/**
 * @brief FastWord统一错误码
 *
 * 系统层返回错误码 / Result，用户层经 ExceptionBridge 转成异常。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 文件操作错误 (20-39)
    FileNotFound = 20,
    FileReadError = 22,

    // 包结构错误 (40-59)
    InvalidPackage = 40,
    PartNotFound = 41,
    InvalidTargetUri = 42,
    UnknownRelationshipId = 43,

    // 文档装配错误 (60-79)
    MalformedRootPart = 60,
    CardinalityViolation = 61,
    MultipleCommentsParts = 62,
    PerItemResolutionFailure = 63,
    DuplicateId = 64,

    // ZIP/XML处理错误 (80-99)
    ZipError = 80,
    XmlParseError = 81,
    SchemaMismatch = 82
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息（部件路径、关系ID等）

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code) {
    return Error(code);
}

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace fastword::core

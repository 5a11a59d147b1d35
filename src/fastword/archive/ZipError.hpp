#pragma once

namespace fastword {
namespace archive {

// 错误码枚举
enum class ZipError {
    Ok,                   // 操作成功
    NotOpen,              // ZIP 文件未打开
    IoFail,               // I/O 操作失败
    BadFormat,            // ZIP 格式错误
    TooLarge,             // 条目超过大小上限
    FileNotFound,         // 条目未找到
    InvalidParameter      // 无效参数
};

constexpr bool isSuccess(ZipError error) noexcept {
    return error == ZipError::Ok;
}

constexpr bool isError(ZipError error) noexcept {
    return error != ZipError::Ok;
}

inline const char* toString(ZipError error) noexcept {
    switch (error) {
        case ZipError::Ok:               return "Ok";
        case ZipError::NotOpen:          return "NotOpen";
        case ZipError::IoFail:           return "IoFail";
        case ZipError::BadFormat:        return "BadFormat";
        case ZipError::TooLarge:         return "TooLarge";
        case ZipError::FileNotFound:     return "FileNotFound";
        case ZipError::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

}} // namespace fastword::archive

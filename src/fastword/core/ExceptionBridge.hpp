/**
 * @file ExceptionBridge.hpp
 * @brief 异常转换层：连接底层Result/Expected和用户层Exception
 */

#pragma once

#include "Expected.hpp"
#include "ErrorCode.hpp"
#include "Exception.hpp"
#include <type_traits>

namespace fastword {
namespace core {

/**
 * @brief 异常转换层
 *
 * 1. 底层（opc / reader / DocumentAssembler）返回 Result
 * 2. 用户层（Document::open、getStyles、getPartById）抛出异常
 * 3. 这里负责两者之间的映射
 */
class ExceptionBridge {
public:
    template<typename T>
    static T unwrap(Result<T>&& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return std::move(result).value();
    }

    template<typename T>
    static const T& unwrap(const Result<T>& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
        return result.value();
    }

    static void unwrap(const VoidResult& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
    }

    static void unwrap(VoidResult&& result) {
        if (result.hasError()) {
            throwFromError(result.error());
        }
    }

    /**
     * @brief 从ErrorCode映射到异常类型并抛出
     */
    [[noreturn]] static void throwFromError(const Error& error) {
        switch (error.code) {
            case ErrorCode::FileNotFound:
            case ErrorCode::FileReadError:
            case ErrorCode::InvalidPackage:
            case ErrorCode::ZipError:
                throw PackageException(error.message, error.context, error.code);

            case ErrorCode::XmlParseError:
            case ErrorCode::SchemaMismatch:
                throw XMLException(error.message, error.context, error.code);

            case ErrorCode::UnknownRelationshipId:
            case ErrorCode::PartNotFound:
            case ErrorCode::InvalidTargetUri:
                throw RelationshipException(error.message, error.context, error.code);

            case ErrorCode::CardinalityViolation:
                throw CardinalityException(error.fullMessage(), error.context);

            case ErrorCode::MalformedRootPart:
            case ErrorCode::MultipleCommentsParts:
            case ErrorCode::PerItemResolutionFailure:
            case ErrorCode::DuplicateId:
                throw AssemblyException(error.fullMessage(), error.code);

            default:
                throw FastWordException(error.fullMessage(), error.code);
        }
    }
};

// 在用户层API中使用，自动转换Result为异常
#define FASTWORD_UNWRAP(result) \
    fastword::core::ExceptionBridge::unwrap(result)

}} // namespace fastword::core

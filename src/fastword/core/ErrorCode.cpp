#include "fastword/core/ErrorCode.hpp"

namespace fastword {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 文件操作错误
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::FileReadError:
            return "File read error";

        // 包结构错误
        case ErrorCode::InvalidPackage:
            return "Invalid package";
        case ErrorCode::PartNotFound:
            return "Part not found";
        case ErrorCode::InvalidTargetUri:
            return "Invalid relationship target URI";
        case ErrorCode::UnknownRelationshipId:
            return "Unknown relationship id";

        // 文档装配错误
        case ErrorCode::MalformedRootPart:
            return "Malformed root part";
        case ErrorCode::CardinalityViolation:
            return "Relationship cardinality violation";
        case ErrorCode::MultipleCommentsParts:
            return "Multiple comments parts";
        case ErrorCode::PerItemResolutionFailure:
            return "Item resolution failure";
        case ErrorCode::DuplicateId:
            return "Duplicate id";

        // ZIP/XML处理错误
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::SchemaMismatch:
            return "XML schema mismatch";
    }
    return "Unknown error";
}

}} // namespace fastword::core

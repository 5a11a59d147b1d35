/**
 * @file Exception.cpp
 * @brief FastWord异常类实现
 */

#include "fastword/core/Exception.hpp"
#include <sstream>
#include <fmt/format.h>

namespace fastword {
namespace core {

// FastWordException 实现
FastWordException::FastWordException(const std::string& message,
                                     ErrorCode code,
                                     const char* file,
                                     int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string FastWordException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void FastWordException::addContext(const std::string& context) {
    context_.push_back(context);
}

// PackageException 实现
PackageException::PackageException(const std::string& message, const std::string& package_path,
                                   ErrorCode code, const char* file, int line)
    : FastWordException(package_path.empty() ? message : fmt::format("{} (package: {})", message, package_path),
                        code, file, line)
    , package_path_(package_path) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message, const std::string& part_name,
                           ErrorCode code, const char* file, int line)
    : FastWordException(part_name.empty() ? message : fmt::format("{} (part: {})", message, part_name),
                        code, file, line)
    , part_name_(part_name) {
}

// RelationshipException 实现
RelationshipException::RelationshipException(const std::string& message,
                                             const std::string& relationship_id,
                                             ErrorCode code, const char* file, int line)
    : FastWordException(fmt::format("{} (relationship: {})", message, relationship_id), code, file, line)
    , relationship_id_(relationship_id) {
}

// CardinalityException 实现
CardinalityException::CardinalityException(const std::string& message,
                                           const std::string& relationship_type,
                                           const char* file, int line)
    : FastWordException(message, ErrorCode::CardinalityViolation, file, line)
    , relationship_type_(relationship_type) {
}

// AssemblyException 实现
AssemblyException::AssemblyException(const std::string& message,
                                     ErrorCode code, const char* file, int line)
    : FastWordException(message, code, file, line) {
}

}} // namespace fastword::core

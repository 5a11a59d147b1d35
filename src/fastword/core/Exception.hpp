/**
 * @file Exception.hpp
 * @brief FastWord异常类定义
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace fastword {
namespace core {

/**
 * @brief FastWord基础异常类
 */
class FastWordException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    FastWordException(const std::string& message,
                      ErrorCode code = ErrorCode::InternalError,
                      const char* file = nullptr,
                      int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（错误码、位置、上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 包/文件相关异常（ZIP 打不开、缺少主文档关系等）
 */
class PackageException : public FastWordException {
public:
    PackageException(const std::string& message, const std::string& package_path,
                     ErrorCode code = ErrorCode::InvalidPackage,
                     const char* file = nullptr, int line = 0);

    const std::string& getPackagePath() const { return package_path_; }

private:
    std::string package_path_;
};

/**
 * @brief XML解析异常
 */
class XMLException : public FastWordException {
public:
    XMLException(const std::string& message,
                 const std::string& part_name = "",
                 ErrorCode code = ErrorCode::XmlParseError,
                 const char* file = nullptr, int line = 0);

    const std::string& getPartName() const { return part_name_; }

private:
    std::string part_name_;
};

/**
 * @brief 关系解析异常（未知关系ID、目标部件缺失）
 */
class RelationshipException : public FastWordException {
public:
    RelationshipException(const std::string& message,
                          const std::string& relationship_id,
                          ErrorCode code = ErrorCode::UnknownRelationshipId,
                          const char* file = nullptr, int line = 0);

    const std::string& getRelationshipId() const { return relationship_id_; }

private:
    std::string relationship_id_;
};

/**
 * @brief 关系基数异常（styles 关系不是恰好一个）
 */
class CardinalityException : public FastWordException {
public:
    CardinalityException(const std::string& message,
                         const std::string& relationship_type,
                         const char* file = nullptr, int line = 0);

    const std::string& getRelationshipType() const { return relationship_type_; }

private:
    std::string relationship_type_;
};

/**
 * @brief 文档装配异常（根部件损坏、严格模式下的逐项失败等）
 */
class AssemblyException : public FastWordException {
public:
    AssemblyException(const std::string& message,
                      ErrorCode code = ErrorCode::MalformedRootPart,
                      const char* file = nullptr, int line = 0);
};

} // namespace core
} // namespace fastword

#pragma once

#include "fastword/core/ErrorCode.hpp"
#include <optional>
#include <string>

namespace fastword {
namespace core {

/**
 * @brief 超链接：关系ID + 解析后的目标URI
 *
 * 两个超链接只要关系ID不同就是不同的条目，即使目标相同。
 * 目标解析失败时 URL 为空，失败原因由 getError() 给出。
 */
class Hyperlink {
public:
    Hyperlink(std::string id, std::string url)
        : id_(std::move(id)), url_(std::move(url)) {}

    Hyperlink(std::string id, Error error)
        : id_(std::move(id)), error_(std::move(error)) {}

    const std::string& getId() const { return id_; }
    const std::string& getURL() const { return url_; }

    bool isResolved() const { return !error_.has_value(); }
    const std::optional<Error>& getError() const { return error_; }

    bool operator==(const Hyperlink& other) const { return id_ == other.id_; }
    bool operator!=(const Hyperlink& other) const { return !(*this == other); }

private:
    std::string id_;
    std::string url_;
    std::optional<Error> error_;
};

}} // namespace fastword::core

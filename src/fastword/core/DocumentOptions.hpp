#pragma once

#include "fastword/core/Constants.hpp"
#include <cstddef>

namespace fastword {
namespace core {

/**
 * @brief 装配策略
 */
enum class AssemblyPolicy {
    Permissive,  // 逐项失败记为诊断，多个 comments 关系取第一个
    Strict       // 逐项失败和多个 comments 关系都终止装配
};

/**
 * @brief 文档打开选项
 */
struct DocumentOptions {
    AssemblyPolicy policy = AssemblyPolicy::Permissive;         // 装配策略
    bool load_header_footer = true;                             // 是否构建页眉页脚策略
    size_t max_part_size = Constants::kDefaultMaxPartSize;      // 单个部件解压上限（字节）
};

}} // namespace fastword::core

#pragma once

// FastWord库 - WordprocessingML (.docx) 文档读取
// 以关系驱动的方式把 OPC 包装配成只读的 Document

#include <string>
#include <memory>

// 公共类型
#include "fastword/core/Document.hpp"
#include "fastword/core/DocumentAssembler.hpp"
#include "fastword/core/DocumentOptions.hpp"
#include "fastword/core/Exception.hpp"

// 版本信息
#define FASTWORD_VERSION_MAJOR 1
#define FASTWORD_VERSION_MINOR 0
#define FASTWORD_VERSION_PATCH 0
#define FASTWORD_VERSION_STRING "1.0.0"

namespace fastword {

inline std::string getVersion() {
    return FASTWORD_VERSION_STRING;
}

} // namespace fastword

// 导出宏定义
#ifdef _WIN32
    #ifdef FASTWORD_SHARED
        #ifdef FASTWORD_EXPORTS
            #define FASTWORD_API __declspec(dllexport)
        #else
            #define FASTWORD_API __declspec(dllimport)
        #endif
    #else
        #define FASTWORD_API
    #endif
#else
    #define FASTWORD_API
#endif

namespace fastword {

/**
 * @brief 初始化FastWord库
 * @param log_file_path 日志文件路径，为空时只输出到控制台
 * @param enable_console 是否启用控制台日志
 * @return 初始化是否成功
 */
FASTWORD_API bool initialize(const std::string& log_file_path = "logs/fastword.log",
                             bool enable_console = true);

/**
 * @brief 清理FastWord库资源（刷新并关闭日志）
 */
FASTWORD_API void cleanup();

/**
 * @brief 打开 .docx 文档
 * @param filename 文件路径
 * @param options 装配选项
 * @throws core::FastWordException 及其子类
 */
FASTWORD_API std::unique_ptr<core::Document> openDocument(const std::string& filename,
                                                          const core::DocumentOptions& options = core::DocumentOptions());

// 类型别名
using Document = core::Document;
using DocumentOptions = core::DocumentOptions;
using AssemblyPolicy = core::AssemblyPolicy;

} // namespace fastword

#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_TRACE(...)    FASTWORD_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    FASTWORD_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     FASTWORD_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     FASTWORD_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    FASTWORD_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  FASTWORD_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   FASTWORD_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   FASTWORD_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  FASTWORD_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     FASTWORD_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      FASTWORD_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     FASTWORD_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) FASTWORD_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)  FASTWORD_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  FASTWORD_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) FASTWORD_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// OPC模块 (opc)
#define OPC_DEBUG(...)     FASTWORD_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)      FASTWORD_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)      FASTWORD_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)     FASTWORD_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

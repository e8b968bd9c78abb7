#pragma once
#include "Logger.hpp"
#include "LogConfig.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 每个模块都有自己的日志宏，格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][CORE] " __VA_ARGS__)
#define CORE_INFO(...)     XLBOOK_LOG_INFO("[INF][CORE] " __VA_ARGS__)
#define CORE_WARN(...)     XLBOOK_LOG_WARN("[WRN][CORE] " __VA_ARGS__)
#define CORE_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][CORE] " __VA_ARGS__)
#define CORE_CRITICAL(...) XLBOOK_LOG_CRITICAL("[CRT][CORE] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)     XLBOOK_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)     XLBOOK_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_INFO(...)     XLBOOK_LOG_INFO("[INF][xml ] " __VA_ARGS__)
#define XML_WARN(...)     XLBOOK_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_INFO(...)     XLBOOK_LOG_INFO("[INF][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)     XLBOOK_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// OPC模块 (opc)
#define OPC_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][opc ] " __VA_ARGS__)
#define OPC_INFO(...)     XLBOOK_LOG_INFO("[INF][opc ] " __VA_ARGS__)
#define OPC_WARN(...)     XLBOOK_LOG_WARN("[WRN][opc ] " __VA_ARGS__)
#define OPC_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][opc ] " __VA_ARGS__)

// 安全模块 (security)
#define SECURITY_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][sec ] " __VA_ARGS__)
#define SECURITY_INFO(...)     XLBOOK_LOG_INFO("[INF][sec ] " __VA_ARGS__)
#define SECURITY_WARN(...)     XLBOOK_LOG_WARN("[WRN][sec ] " __VA_ARGS__)
#define SECURITY_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][sec ] " __VA_ARGS__)

// 示例模块 (demo)
#define DEMO_DEBUG(...)    XLBOOK_LOG_DEBUG("[DBG][demo] " __VA_ARGS__)
#define DEMO_INFO(...)     XLBOOK_LOG_INFO("[INF][demo] " __VA_ARGS__)
#define DEMO_WARN(...)     XLBOOK_LOG_WARN("[WRN][demo] " __VA_ARGS__)
#define DEMO_ERROR(...)    XLBOOK_LOG_ERROR("[ERR][demo] " __VA_ARGS__)

// 示例模块别名 (examples)
#define EXAMPLE_INFO(...)     DEMO_INFO(__VA_ARGS__)
#define EXAMPLE_WARN(...)     DEMO_WARN(__VA_ARGS__)
#define EXAMPLE_ERROR(...)    DEMO_ERROR(__VA_ARGS__)

// 条件日志宏 (使用模块宏实现)
#if ENABLE_ZIP_DEBUG_LOGS
    #define XLBOOK_LOG_ZIP_DEBUG(...) ARCHIVE_DEBUG(__VA_ARGS__)
#else
    #define XLBOOK_LOG_ZIP_DEBUG(...) do {} while(0)
#endif

#if ENABLE_SAX_DEBUG_LOGS
    #define XLBOOK_LOG_SAX_DEBUG(...) READER_DEBUG(__VA_ARGS__)
#else
    #define XLBOOK_LOG_SAX_DEBUG(...) do {} while(0)
#endif

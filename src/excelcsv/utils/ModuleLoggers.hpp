#pragma once
#include "Logger.hpp"

/**
 * @file ModuleLoggers.hpp
 * @brief 模块化日志宏定义
 *
 * 格式: [等级][模块] 消息
 */

// 核心模块 (core)
#define CORE_TRACE(...)    EXCELCSV_LOG_TRACE("[TRC][core] " __VA_ARGS__)
#define CORE_DEBUG(...)    EXCELCSV_LOG_DEBUG("[DBG][core] " __VA_ARGS__)
#define CORE_INFO(...)     EXCELCSV_LOG_INFO("[INF][core] " __VA_ARGS__)
#define CORE_WARN(...)     EXCELCSV_LOG_WARN("[WRN][core] " __VA_ARGS__)
#define CORE_ERROR(...)    EXCELCSV_LOG_ERROR("[ERR][core] " __VA_ARGS__)

// 读取模块 (reader)
#define READER_DEBUG(...)  EXCELCSV_LOG_DEBUG("[DBG][read] " __VA_ARGS__)
#define READER_INFO(...)   EXCELCSV_LOG_INFO("[INF][read] " __VA_ARGS__)
#define READER_WARN(...)   EXCELCSV_LOG_WARN("[WRN][read] " __VA_ARGS__)
#define READER_ERROR(...)  EXCELCSV_LOG_ERROR("[ERR][read] " __VA_ARGS__)

// XML模块 (xml)
#define XML_DEBUG(...)     EXCELCSV_LOG_DEBUG("[DBG][xml ] " __VA_ARGS__)
#define XML_WARN(...)      EXCELCSV_LOG_WARN("[WRN][xml ] " __VA_ARGS__)
#define XML_ERROR(...)     EXCELCSV_LOG_ERROR("[ERR][xml ] " __VA_ARGS__)

// 归档模块 (archive)
#define ARCHIVE_DEBUG(...) EXCELCSV_LOG_DEBUG("[DBG][arch] " __VA_ARGS__)
#define ARCHIVE_WARN(...)  EXCELCSV_LOG_WARN("[WRN][arch] " __VA_ARGS__)
#define ARCHIVE_ERROR(...) EXCELCSV_LOG_ERROR("[ERR][arch] " __VA_ARGS__)

// 命令行模块 (cli)
#define CLI_DEBUG(...)     EXCELCSV_LOG_DEBUG("[DBG][cli ] " __VA_ARGS__)
#define CLI_INFO(...)      EXCELCSV_LOG_INFO("[INF][cli ] " __VA_ARGS__)
#define CLI_WARN(...)      EXCELCSV_LOG_WARN("[WRN][cli ] " __VA_ARGS__)
#define CLI_ERROR(...)     EXCELCSV_LOG_ERROR("[ERR][cli ] " __VA_ARGS__)

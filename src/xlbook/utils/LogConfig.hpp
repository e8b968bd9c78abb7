#pragma once

// 日志控制宏
// 设置为 0 禁用特定类型的日志，设置为 1 启用（可由构建选项覆盖）

#ifndef ENABLE_ZIP_DEBUG_LOGS
#define ENABLE_ZIP_DEBUG_LOGS 0   // ZIP 逐条目读写日志
#endif

#ifndef ENABLE_SAX_DEBUG_LOGS
#define ENABLE_SAX_DEBUG_LOGS 0   // SAX 逐元素解析日志
#endif

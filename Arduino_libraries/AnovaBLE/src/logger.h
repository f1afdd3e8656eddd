#ifndef LOGGER_H
#define LOGGER_H

#include <stddef.h>

// Current log level
extern int currentLogLevel;

// Log levels
#define LOG_LEVEL_NONE  0
#define LOG_LEVEL_ERROR 1
#define LOG_LEVEL_WARN  2
#define LOG_LEVEL_INFO  3
#define LOG_LEVEL_DEBUG 4

// Macros for logging
#define LOGE(...) do { if (currentLogLevel >= LOG_LEVEL_ERROR) logPrintLevelln("ERROR", __VA_ARGS__); } while (0)
#define LOGW(...) do { if (currentLogLevel >= LOG_LEVEL_WARN)  logPrintLevelln("WARN",  __VA_ARGS__); } while (0)
#define LOGI(...) do { if (currentLogLevel >= LOG_LEVEL_INFO)  logPrintLevelln("INFO",  __VA_ARGS__); } while (0)

// Debug output is compiled in only with -DDEBUG
#ifdef DEBUG
    #define LOGD(...) do { if (currentLogLevel >= LOG_LEVEL_DEBUG) logPrintLevelln("DEBUG", __VA_ARGS__); } while (0)
#else
    #define LOGD(...) do { } while (0)
#endif

// Functions to print log messages
void logPrintLevelln(const char* level, const char* format, ...);

// Makes carriage returns and other control bytes of protocol text printable ("\r" -> "\\r")
// Returns out
char* logEscape(char* out, size_t outLen, const char* text, size_t len);

#endif // LOGGER_H

#pragma once

#include <iostream>

// ============================================================================
// Log level control
// ============================================================================
// Higher number = more verbose
#define LOG_LEVEL_SILENT  0  // No logs
#define LOG_LEVEL_ERROR   1  // Errors only
#define LOG_LEVEL_WARN    2  // Warnings + errors
#define LOG_LEVEL_INFO    3  // Episodes, training, export (default)
#define LOG_LEVEL_VERBOSE 4  // Per-sample and per-tick details

// Override by defining LOG_LEVEL before including this header,
// or with -DUPRIGHT_LOG_LEVEL=<n> at configure time.
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// Messages are stream expressions: LOG_INFO("[Scheduler] Episode " << n);
#define LOG_VERBOSE(msg) do { if(LOG_LEVEL >= LOG_LEVEL_VERBOSE) { std::cout << msg << std::endl; } } while(0)
#define LOG_INFO(msg)    do { if(LOG_LEVEL >= LOG_LEVEL_INFO)    { std::cout << msg << std::endl; } } while(0)
#define LOG_WARN(msg)    do { if(LOG_LEVEL >= LOG_LEVEL_WARN)    { std::cerr << msg << std::endl; } } while(0)
#define LOG_ERROR(msg)   do { if(LOG_LEVEL >= LOG_LEVEL_ERROR)   { std::cerr << "[ERROR] " << msg << std::endl; } } while(0)

namespace upright {

inline const char* logLevelName() {
    #if LOG_LEVEL == LOG_LEVEL_SILENT
        return "SILENT";
    #elif LOG_LEVEL == LOG_LEVEL_ERROR
        return "ERROR";
    #elif LOG_LEVEL == LOG_LEVEL_WARN
        return "WARN";
    #elif LOG_LEVEL == LOG_LEVEL_INFO
        return "INFO";
    #elif LOG_LEVEL == LOG_LEVEL_VERBOSE
        return "VERBOSE";
    #else
        return "UNKNOWN";
    #endif
}

} // namespace upright

// Print current log level (call once at startup)
#define LOG_PRINT_LEVEL() do { std::cout << "[Log] Level: " << upright::logLevelName() << " (" << LOG_LEVEL << ")" << std::endl; } while(0)

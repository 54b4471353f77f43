//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging for toolhub (console + optional file sink, {fmt}-style formatting)
//==========================================================================================================
#pragma once

#include <mutex>
#include <iostream>
#include <sstream>
#include <fstream>
#include <string>
#include <cstring>
#include <errno.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <cstdlib>
#include <cctype>

#include <fmt/format.h>

#include "env/EnvVars.h"

// Log level enum
enum class LogLevel {
    LOG_DEBUG_LEVEL,
    LOG_INFO_LEVEL,
    LOG_WARN_LEVEL,
    LOG_ERROR_LEVEL,
    LOG_FATAL_LEVEL
};

class Logger {
public:
    // Convert common level strings to LogLevel (case-insensitive). Defaults to INFO.
    static LogLevel levelFromString(const std::string& lvl) {
        std::string s; s.reserve(lvl.size());
        for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
        if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
        if (s == "INFO")  return LogLevel::LOG_INFO_LEVEL;
        if (s == "WARN" || s == "WARNING")  return LogLevel::LOG_WARN_LEVEL;
        if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
        if (s == "FATAL") return LogLevel::LOG_FATAL_LEVEL;
        return LogLevel::LOG_INFO_LEVEL;
    }

    // Variadic logging using fmt::vformat with runtime format strings
    template <typename... Args>
    static void logf(const char* level, const char* fmt, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error: {}", e.what());
        }
        log(level, buffer, file, line);
    }

    // Applies TOOLHUB_LOG_LEVEL when present; call once early in main().
    static void configureFromEnv() {
        const std::string lvl = GetEnvOrDefault("TOOLHUB_LOG_LEVEL", "");
        if (!lvl.empty()) {
            setLogLevel(levelFromString(lvl));
        }
        const std::string file = GetEnvOrDefault("TOOLHUB_LOG_FILE", "");
        if (!file.empty()) {
            setLogFile(file);
        }
    }

    static void setLogLevel(LogLevel level) {
        sLogLevel = level;
    }

    static void setLogFile(const std::string& filePath) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        if (sLogFile.is_open()) {
            sLogFile.close();
        }
        sLogFile.open(filePath, std::ios::out | std::ios::app);
        if (!sLogFile.is_open()) {
            std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
            return;
        }
        auto now = std::chrono::system_clock::now();
        std::time_t now_time = std::chrono::system_clock::to_time_t(now);
        std::tm buf{};
        ::localtime_r(&now_time, &buf);
        sLogFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
        sLogFile.flush();
    }

    static void log(const char* level, const std::string& msg, const char* file, unsigned int line) {
        std::lock_guard<std::mutex> lock(sLogMutex);
        std::ostringstream oss;
        // Optional ANSI colorization for LABEL only controlled by TOOLHUB_LOG_COLOR
        static bool colorEnabled = [](){
            const std::string v = GetEnvOrDefault("TOOLHUB_LOG_COLOR", "1");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        const char* reset = colorEnabled ? "\033[0m" : "";
        const char* labelColor = "";
        if (colorEnabled) {
            labelColor = (::strncmp(level, "ERROR", 5) == 0) ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
        }
        if (*labelColor) {
            oss << "[" << labelColor << level << reset << "] " << file << ":" << line << ": " << msg << std::endl;
        } else {
            oss << "[" << level << "] " << file << ":" << line << ": " << msg << std::endl;
        }

        std::string logMessage = oss.str();

        // Provider processes set TOOLHUB_STDIO_MODE=1 so stdout stays reserved for JSON-RPC frames
        static bool useStderr = [](){
            const std::string v = GetEnvOrDefault("TOOLHUB_STDIO_MODE", "0");
            return (v == "1" || v == "true" || v == "TRUE");
        }();
        if (useStderr) {
            std::cerr << logMessage;
        } else {
            std::cout << logMessage;
        }

        if (sLogFile.is_open()) {
            sLogFile << logMessage;
            sLogFile.flush();
        }
    }

    static LogLevel sLogLevel;

private:
    static std::ofstream sLogFile;
    static std::mutex sLogMutex;
};

// Static members are defined in Logger.cpp

// Logging macros with log level filtering
#define LOG_DEBUG(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_DEBUG_LEVEL) Logger::logf("DEBUG", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_INFO_LEVEL)  Logger::logf("INFO", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  if (Logger::sLogLevel <= LogLevel::LOG_WARN_LEVEL)  Logger::logf("WARN", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) if (Logger::sLogLevel <= LogLevel::LOG_ERROR_LEVEL) Logger::logf("ERROR", fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) do { Logger::logf("FATAL", fmt, __FILE__, __LINE__, ##__VA_ARGS__); ::_Exit(EXIT_FAILURE); } while(0)

// Function entry/exit macros for logging
#ifdef _DEBUG
#define FUNC_ENTRY() LOG_DEBUG("ENTER: {}", __FUNCTION__)
#define FUNC_EXIT()  LOG_DEBUG("EXIT:  {}", __FUNCTION__)

// Scope-based entry/exit guard to avoid manual pairs and ensure correct function on exit
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_ENTRY() ((void)0)
#define FUNC_EXIT()  ((void)0)
#define FUNC_SCOPE() ((void)0)
#endif

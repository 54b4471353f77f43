//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members. The initial level honours TOOLHUB_LOG_LEVEL so library
//          code logging before main() calls configureFromEnv() already filters correctly.
//==========================================================================================================

#include "logging/Logger.h"

// Define static members
LogLevel Logger::sLogLevel = Logger::levelFromString(GetEnvOrDefault("TOOLHUB_LOG_LEVEL", "INFO"));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

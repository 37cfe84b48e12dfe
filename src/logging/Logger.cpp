//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state; the initial level comes from MCPGW_LOG_LEVEL (default INFO).
//==========================================================================================================

#include "logging/Logger.h"

namespace {

LogLevel initialLogLevel() {
    switch (Logger::levelFromString(GetEnvOrDefault("MCPGW_LOG_LEVEL", "INFO"))) {
        case Logger::Level::DEBUG: return LogLevel::LOG_DEBUG_LEVEL;
        case Logger::Level::INFO:  return LogLevel::LOG_INFO_LEVEL;
        case Logger::Level::WARN:  return LogLevel::LOG_WARN_LEVEL;
        case Logger::Level::ERROR: return LogLevel::LOG_ERROR_LEVEL;
        case Logger::Level::FATAL: return LogLevel::LOG_FATAL_LEVEL;
    }
    return LogLevel::LOG_INFO_LEVEL;
}

} // namespace

LogLevel Logger::sLogLevel = initialLogLevel();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

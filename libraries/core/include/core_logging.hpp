// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

/*
    Logging based on spdlog

    Every component logs through the default logger installed by
    SetupAsyncDiskLog(), prefixing lines with its own name:

    spdlog::info("{} Peer connected", NetLocalName);
    spdlog::warn("{} Dropped frame seq={} deadline missed", NetLocalName, seq);

    Levels in use:
        debug: per-frame and per-message tracing
        info:  connection and session lifecycle
        warn:  recoverable problems (stale messages, slow peers)
        error: failed operations and protocol violations
*/

#pragma once

#include "core.hpp"

#include <spdlog/spdlog.h>

#include <string>

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

// OS-specific directory path for logs
std::string GetLogFilePath(
    const std::string& company_name,
    const std::string& application_name);

// Get an OS-specific file path for a settings file
std::string GetSettingsFilePath(
    const std::string& company_name,
    const std::string& file_name);

// Set up color console and rotated disk logging from a background thread
void SetupAsyncDiskLog(const std::string& filename);

// Parse a level name like "debug" or "warn", returning info if unrecognized
spdlog::level::level_enum ParseLogLevel(const std::string& name);


} // namespace lanmeet

// Copyright (c) 2019 Christopher A. Taylor.  All rights reserved.

#include "core_logging.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <cstdlib> // getenv, atexit
#include <cerrno>

#ifdef _WIN32
#include <shlwapi.h>
#include <shlobj.h>
#pragma comment(lib,"shlwapi.lib")
#else
#include <sys/stat.h>
#endif // _WIN32

namespace lanmeet {


//------------------------------------------------------------------------------
// Tools

#ifdef _WIN32

static std::string GetAppDataFilePath(
    const std::string& company_name,
    const std::string& file_name)
{
    char szPath[MAX_PATH];
    HRESULT hr = ::SHGetFolderPathA(NULL, CSIDL_LOCAL_APPDATA, NULL, 0, szPath);
    if (FAILED(hr)) {
        return file_name;
    }

    const std::string company_path = fmt::format("\\{}", company_name);
    BOOL result = ::PathAppendA(szPath, company_path.c_str());
    if (!result) {
        return file_name;
    }

    ::CreateDirectory(szPath, nullptr);

    const std::string app_path = fmt::format("\\{}", file_name);
    result = ::PathAppendA(szPath, app_path.c_str());
    if (!result) {
        return file_name;
    }

    return szPath;
}

#else // _WIN32

static std::string GetAppDataFilePath(
    const std::string& company_name,
    const std::string& file_name)
{
    const char* home = std::getenv("HOME");
    if (!home || home[0] == '\0') {
        return file_name;
    }

    const std::string config_dir = fmt::format("{}/.config", home);
    ::mkdir(config_dir.c_str(), 0755);

    const std::string company_dir = fmt::format("{}/{}", config_dir, company_name);
    if (::mkdir(company_dir.c_str(), 0755) != 0 && errno != EEXIST) {
        return file_name;
    }

    return fmt::format("{}/{}", company_dir, file_name);
}

#endif // _WIN32

std::string GetLogFilePath(
    const std::string& company_name,
    const std::string& application_name)
{
    const std::string file_name = fmt::format("{}.log", application_name);
    return GetAppDataFilePath(company_name, file_name);
}

std::string GetSettingsFilePath(
    const std::string& company_name,
    const std::string& file_name)
{
    return GetAppDataFilePath(company_name, file_name);
}

static void AtExitWrapper()
{
    spdlog::info("Terminated");
    spdlog::shutdown();
}

void SetupAsyncDiskLog(const std::string& filename)
{
    spdlog::init_thread_pool(8192, 1);
    auto stdout_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        filename,
        4*1024*1024,
        3);
    std::vector<spdlog::sink_ptr> sinks {
        stdout_sink,
        rotating_sink
    };
    auto logger = std::make_shared<spdlog::async_logger>(
        filename,
        sinks.begin(), sinks.end(),
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(logger);

    spdlog::set_default_logger(logger);

    spdlog::set_pattern("[%H:%M:%S.%e %z] [%^%L%$] %v");

    spdlog::set_level(spdlog::level::debug);

    // Register an atexit() callback so we do not need manual shutdown in app code
    std::atexit(AtExitWrapper);
}

spdlog::level::level_enum ParseLogLevel(const std::string& name)
{
    const spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}


} // namespace lanmeet

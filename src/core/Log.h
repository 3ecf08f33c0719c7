// src/core/Log.h
#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace maze::logsys {

inline constexpr const char* kDefaultLogFile = "logs/maze.log";

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;

    // Colour stderr sink; tests turn it off to keep doctest output clean.
    bool console = true;

    // Optional plain file sink (truncated on Init).
    std::optional<std::filesystem::path> file;
};

// Installs the "maze" logger as spdlog's default logger. Safe to call again;
// the previous logger is replaced.
void Init(const LogOptions& options = {});

void Shutdown();

// "maze" (nullptr before Init)
std::shared_ptr<spdlog::logger> Get();

} // namespace maze::logsys

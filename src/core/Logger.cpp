/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds use inline definitions
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>

namespace HordeEngine {
namespace {

// One log per run; the run before it is kept beside it for comparison
class SessionLog {
public:
    static SessionLog& Instance() {
        static SessionLog instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        // Milliseconds since SDL started ticking, so lines line up with the
        // simulation clock rather than the wall clock
        const double elapsed = static_cast<double>(SDL_GetTicks()) / 1000.0;
        const std::string line =
            std::format("[{:>10.3f}s] {:<8} {}: {}\n", elapsed, level, system, message);

        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }

        if (m_stream.is_open()) {
            // Release builds only route CRITICAL and ERROR here; both are rare
            m_stream << line;
            m_stream.flush();
        }

        if (!m_stream.is_open() || std::strcmp(level, "CRITICAL") == 0) {
            std::fputs(line.c_str(), stderr);
        }
    }

private:
    SessionLog() = default;
    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    void open() {
        m_opened = true;

        // HORDE_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("HordeEngine", HORDE_APP_NAME);
        if (prefPath == nullptr) {
            return; // stderr only
        }

        namespace fs = std::filesystem;
        const fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        const fs::path current = logDir / std::format("{}-session.log", HORDE_APP_NAME);
        const fs::path previous = logDir / std::format("{}-previous.log", HORDE_APP_NAME);
        if (fs::exists(current, ec)) {
            fs::rename(current, previous, ec);
        }

        m_stream.open(current, std::ios::out | std::ios::trunc);
        if (m_stream.is_open()) {
            const auto started =
                std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
            m_stream << std::format("=== {} population session, started {:%Y-%m-%d %H:%M:%S} UTC ===\n",
                                    HORDE_APP_NAME, started);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened = false;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    SessionLog::Instance().write(level, system, message);
}

} // namespace HordeEngine

#endif // ifndef DEBUG

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <system_error>

namespace LatticeEngine {
namespace {

constexpr const char* LOG_BASENAME = "lattice";
constexpr std::uintmax_t MAX_LOG_BYTES = 1024 * 1024;
constexpr int KEPT_ROTATIONS = 4; // lattice.1.log .. lattice.4.log
constexpr size_t FLUSH_INTERVAL = 32;

std::tm localTime(std::time_t time) {
    std::tm result{};
#ifdef _WIN32
    localtime_s(&result, &time);
#else
    localtime_r(&time, &result);
#endif
    return result;
}

/**
 * Appends to <directory>/logs/lattice.log and rotates it by size:
 * lattice.log -> lattice.1.log -> ... -> lattice.4.log, dropping the oldest.
 * Failures disable file logging; there is nowhere left to report them.
 */
class RotatingLogFile {
public:
    static RotatingLogFile& Instance() {
        static RotatingLogFile instance;
        return instance;
    }

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        close();
        m_logDir = directory.empty() ? std::filesystem::path{}
                                     : std::filesystem::path(directory) / "logs";
        m_opened = false;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        const auto now = std::chrono::system_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()) % 1000;
        const std::tm stamp = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&stamp, "%Y-%m-%d %H:%M:%S")
                 << std::format(".{:03} [{}] [{}] {}\n", ms.count(), level, system, message);

        const bool critical = std::strcmp(level, "CRITICAL") == 0;
        if (critical || ++m_unflushed >= FLUSH_INTERVAL) {
            m_stream.flush();
            m_unflushed = 0;
        }

        if (static_cast<std::uintmax_t>(m_stream.tellp()) >= MAX_LOG_BYTES) {
            rotate();
        }
    }

private:
    RotatingLogFile() = default;
    ~RotatingLogFile() { close(); }

    RotatingLogFile(const RotatingLogFile&) = delete;
    RotatingLogFile& operator=(const RotatingLogFile&) = delete;

    std::filesystem::path pathFor(int rotation) const {
        if (rotation == 0) {
            return m_logDir / std::format("{}.log", LOG_BASENAME);
        }
        return m_logDir / std::format("{}.{}.log", LOG_BASENAME, rotation);
    }

    void open() {
        m_opened = true;
        if (m_logDir.empty()) {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(m_logDir, ec);
        if (ec) {
            return;
        }

        m_stream.open(pathFor(0), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            const std::tm started = localTime(std::time(nullptr));
            m_stream << "=== " << LATTICE_APP_NAME << " session started "
                     << std::put_time(&started, "%Y-%m-%d %H:%M:%S") << " ===\n";
            m_stream.flush();
        }
    }

    void rotate() {
        close();

        std::error_code ec;
        std::filesystem::remove(pathFor(KEPT_ROTATIONS), ec);
        for (int rotation = KEPT_ROTATIONS - 1; rotation >= 0; --rotation) {
            const auto from = pathFor(rotation);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, pathFor(rotation + 1), ec);
            }
        }

        m_opened = false;
        open();
    }

    void close() {
        if (m_stream.is_open()) {
            m_stream.flush();
            m_stream.close();
        }
        m_unflushed = 0;
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    std::filesystem::path m_logDir;
    size_t m_unflushed{0};
    bool m_opened{false};
};

} // namespace

void Logger::SetLogDirectory(const std::string& directory) {
    RotatingLogFile::Instance().setDirectory(directory);
}

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    RotatingLogFile::Instance().write(level, system, message);
}

} // namespace LatticeEngine

#endif // ifndef DEBUG

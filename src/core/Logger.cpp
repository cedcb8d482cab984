/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only - debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <vector>

namespace Skybound {
namespace {

constexpr size_t MAX_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 32;
constexpr const char *LOG_PREFIX = "skybound_";

std::tm localTime(std::time_t t) {
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &t);
#else
  localtime_r(&t, &result);
#endif
  return result;
}

// Rotating file sink for CRITICAL/ERROR messages in release builds
class FileLogger {
public:
  static FileLogger &Instance() {
    static FileLogger instance;
    return instance;
  }

  void write(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_fileMutex);

    if (!m_initialized) {
      open();
    }
    if (!m_stream.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(now));
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count() %
                    1000;

    m_stream << std::format(
        "{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] [{}] {}\n",
        tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
        tm.tm_sec, ms, level, system, message);

    if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_INTERVAL) {
      m_stream.flush();
      m_pending = 0;
    }
  }

private:
  FileLogger() = default;

  ~FileLogger() {
    if (m_stream.is_open()) {
      m_stream.flush();
    }
  }

  FileLogger(const FileLogger &) = delete;
  FileLogger &operator=(const FileLogger &) = delete;

  void open() {
    namespace fs = std::filesystem;
    m_initialized = true;

    // SKYBOUND_APP_NAME is defined via CMake from ${PROJECT_NAME}
    char *prefPath = SDL_GetPrefPath("HammerForged", SKYBOUND_APP_NAME);
    if (prefPath == nullptr) {
      return;
    }
    const fs::path logDir = fs::path(prefPath) / "logs";
    SDL_free(prefPath);

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
      return;
    }

    pruneOldLogs(logDir);

    const std::tm tm = localTime(std::time(nullptr));
    const std::string fileName =
        std::format("{}{:04}{:02}{:02}_{:02}{:02}{:02}.log", LOG_PREFIX,
                    tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                    tm.tm_min, tm.tm_sec);

    m_stream.open(logDir / fileName, std::ios::out | std::ios::app);
    if (m_stream.is_open()) {
      m_stream << "=== " << SKYBOUND_APP_NAME << " Log ===\n";
      m_stream.flush();
    }
  }

  // Leaves room for the file about to be opened
  static void pruneOldLogs(const std::filesystem::path &logDir) {
    namespace fs = std::filesystem;

    std::vector<fs::directory_entry> logs;
    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(logDir, ec)) {
      if (entry.path().extension() == ".log" &&
          entry.path().filename().string().starts_with(LOG_PREFIX)) {
        logs.push_back(entry);
      }
    }

    if (logs.size() < MAX_LOG_FILES) {
      return;
    }

    std::sort(logs.begin(), logs.end(),
              [](const fs::directory_entry &a, const fs::directory_entry &b) {
                return a.last_write_time() < b.last_write_time();
              });

    const size_t excess = logs.size() - MAX_LOG_FILES + 1;
    for (size_t i = 0; i < excess; ++i) {
      fs::remove(logs[i].path(), ec);
    }
  }

  std::mutex m_fileMutex;
  std::ofstream m_stream;
  bool m_initialized{false};
  size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char *level, const char *system,
                 const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  FileLogger::Instance().write(level, system, message);
}

} // namespace Skybound

#endif // ifndef DEBUG

#include "stlquote/Logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stlquote {

    namespace {
        std::atomic<int> minLevel{static_cast<int>(Logger::Level::Info)};
        std::mutex outputMutex;

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto in_time = std::chrono::system_clock::to_time_t(now);
            std::tm local{};
            localtime_r(&in_time, &local);
            std::ostringstream ss;
            ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return ss.str();
        }

        void log(Logger::Level level, const char* label, const std::string& message) {
            if (static_cast<int>(level) < minLevel.load(std::memory_order_relaxed)) {
                return;
            }
            std::string line = "[" + timestamp() + "] [" + label + "] " + message;
            std::lock_guard<std::mutex> lock(outputMutex);
            std::cerr << line << std::endl;
        }
    }

    void Logger::debug(const std::string& message) {
        log(Level::Debug, "DEBUG", message);
    }

    void Logger::info(const std::string& message) {
        log(Level::Info, "INFO", message);
    }

    void Logger::warn(const std::string& message) {
        log(Level::Warn, "WARN", message);
    }

    void Logger::error(const std::string& message) {
        log(Level::Error, "ERROR", message);
    }

    void Logger::setLevel(Level level) {
        minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    Logger::Level Logger::level() {
        return static_cast<Level>(minLevel.load(std::memory_order_relaxed));
    }

    bool Logger::parseLevel(const std::string& name, Level& out) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") {
            out = Level::Debug;
        } else if (lower == "info") {
            out = Level::Info;
        } else if (lower == "warn" || lower == "warning") {
            out = Level::Warn;
        } else if (lower == "error") {
            out = Level::Error;
        } else {
            return false;
        }
        return true;
    }

} // namespace stlquote

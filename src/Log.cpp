#include "Log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::atomic<LogLevel> currentLevel{LogLevel::Info};
std::ostream* currentStream = &std::cerr;
std::mutex streamMutex;
}

void setLogLevel(LogLevel level) {
    currentLevel.store(level);
}

LogLevel logLevel() {
    return currentLevel.load();
}

void setLogStream(std::ostream* stream) {
    std::lock_guard lock(streamMutex);
    currentStream = stream ? stream : &std::cerr;
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LogLevel::Debug;
    } else if (text == "info") {
        level = LogLevel::Info;
    } else if (text == "warn" || text == "warning") {
        level = LogLevel::Warn;
    } else if (text == "error") {
        level = LogLevel::Error;
    } else if (text == "off") {
        level = LogLevel::Off;
    } else {
        return false;
    }
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

void logMessage(LogLevel level, const std::string& message) {
    if (level == LogLevel::Off || level < currentLevel.load()) {
        return;
    }
    std::lock_guard lock(streamMutex);
    (*currentStream) << "[" << logLevelName(level) << "] " << message << std::endl;
}

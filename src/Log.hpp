#pragma once
#include <ostream>
#include <string>

enum class LogLevel { Debug = 0, Info, Warn, Error, Off };

// Process-wide diagnostics. Lines go to std::cerr unless redirected.
void setLogLevel(LogLevel level);
LogLevel logLevel();
void setLogStream(std::ostream* stream);

bool parseLogLevel(const std::string& text, LogLevel& level);
const char* logLevelName(LogLevel level);

void logMessage(LogLevel level, const std::string& message);

inline void logDebug(const std::string& message) { logMessage(LogLevel::Debug, message); }
inline void logInfo(const std::string& message) { logMessage(LogLevel::Info, message); }
inline void logWarn(const std::string& message) { logMessage(LogLevel::Warn, message); }
inline void logError(const std::string& message) { logMessage(LogLevel::Error, message); }

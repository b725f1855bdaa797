// RISKVAULT - Logging Implementation
// Copyright (c) 2024 RiskVault Developers
// MIT License

#include "riskvault/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

#include <unistd.h>

namespace riskvault {
namespace util {

namespace {

/// "2024-01-15 10:30:00.123 [INFO] [vault] "
std::string FormatPrefix(const LogEntry& entry) {
    std::time_t secs = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);
    char stamp[32];
    size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(stamp + n, sizeof(stamp) - n, ".%03lld", static_cast<long long>(millis));

    std::string out = stamp;
    out += " [";
    out += LogLevelToString(entry.level);
    out += "] ";
    if (!entry.category.empty()) {
        out += "[" + entry.category + "] ";
    }
    return out;
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "\033[32m";
    }
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel level, bool useColors)
    : ILogSink(level), useColors_(useColors) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatPrefix(entry) + entry.message;
    FILE* out = entry.level >= LogLevel::Warn ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (useColors_ && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", ColorFor(entry.level), line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : ILogSink(level), file_(path, std::ios::out | std::ios::app) {}

FileSink::~FileSink() {
    Flush();
}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatPrefix(entry);
    if (!entry.file.empty()) {
        size_t slash = entry.file.find_last_of("/\\");
        line += (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1));
        line += ":" + std::to_string(entry.line) + " ";
    }
    line += entry.message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Flush();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Submit(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace riskvault

// RISKVAULT - Logging System
// Copyright (c) 2024 RiskVault Developers
// MIT License
//
// Leveled logging fanned out to console and debug.log sinks.
//   LOG_INFO(LogCategory::VAULT) << "accepted " << id;

#ifndef RISKVAULT_UTIL_LOGGING_H
#define RISKVAULT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace riskvault {
namespace util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* VAULT = "vault";
    constexpr const char* PASSPORT = "passport";
    constexpr const char* ACCESS = "access";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CRYPTO = "crypto";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

/// Output destination with its own threshold on top of the logger's
class ILogSink {
public:
    explicit ILogSink(LogLevel level) : level_(level) {}
    virtual ~ILogSink() = default;

    void Submit(const LogEntry& entry) {
        if (entry.level >= level_.load()) {
            Write(entry);
        }
    }
    virtual void Flush() = 0;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    virtual void Write(const LogEntry& entry) = 0;

private:
    std::atomic<LogLevel> level_;
};

/// Info and below to stdout, warnings and errors to stderr
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Info, bool useColors = true);

    void Flush() override;

protected:
    void Write(const LogEntry& entry) override;

private:
    bool useColors_;
    std::mutex mutex_;
};

/// Appends to a file, typically debug.log in the data directory
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    void Flush() override;

protected:
    void Write(const LogEntry& entry) override;

private:
    std::ofstream file_;
    std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load();
    }

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

/// Buffers one message and submits it when the statement ends
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// The if/else form keeps a trailing else bound correctly and skips
// evaluating the streamed operands when the level is filtered out.
#define RISKVAULT_LOG(level, category) \
    if (!::riskvault::util::Logger::Instance().WillLog(::riskvault::util::LogLevel::level)) {} \
    else ::riskvault::util::LogStream(::riskvault::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_DEBUG(category)   RISKVAULT_LOG(Debug, category)
#define LOG_INFO(category)    RISKVAULT_LOG(Info, category)
#define LOG_WARN(category)    RISKVAULT_LOG(Warn, category)
#define LOG_ERROR(category)   RISKVAULT_LOG(Error, category)

} // namespace util
} // namespace riskvault

#endif // RISKVAULT_UTIL_LOGGING_H

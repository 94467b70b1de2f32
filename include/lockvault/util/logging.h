// LOCKVAULT - Logging System
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License
//
// Leveled logging with per-subsystem categories (vault, ledger, db, config,
// cli). Entries fan out to sinks: the console (stderr, so command output on
// stdout stays clean), a rotating file, or a callback used by tests.
//
//   LOG_WARN(util::LogCategory::VAULT) << "re-priced " << n << " positions";

#ifndef LOCKVAULT_UTIL_LOGGING_H
#define LOCKVAULT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace lockvault {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted, anything else is Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* VAULT = "vault";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
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

/// Output destination with its own level threshold
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

private:
    std::atomic<LogLevel> level_;
};

/// One line per entry on stderr
class ConsoleSink : public LogSink {
public:
    struct Options {
        bool colors{true};
        bool timestamps{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() : ConsoleSink(Options()) {}
    explicit ConsoleSink(const Options& options);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Options options_;
    std::mutex mutex_;
};

/// Appends to a file; at maxSize the file moves to path.1 (path.1 to
/// path.2, and so on up to maxFiles) and a new one is started
class FileSink : public LogSink {
public:
    struct Options {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Options& options);

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    void Rotate();

    Options options_;
    std::ofstream file_;
    size_t size_{0};
    mutable std::mutex mutex_;
};

class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : LogSink(level), callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override {
        if (callback_) callback_(entry);
    }

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// After the first EnableCategory only enabled categories are logged
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::set<std::string> categories_;
    std::atomic<bool> allCategories_{true};
    mutable std::mutex categoriesMutex_;
};

/// Buffers one message and hands it to the logger when destroyed
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

// The stream is only built when the entry will be kept
#define LOCKVAULT_LOG(level, category) \
    if (!::lockvault::util::Logger::Instance().WillLog( \
            ::lockvault::util::LogLevel::level, category)) {} else \
        ::lockvault::util::LogStream(::lockvault::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_DEBUG(category) LOCKVAULT_LOG(Debug, category)
#define LOG_INFO(category)  LOCKVAULT_LOG(Info, category)
#define LOG_WARN(category)  LOCKVAULT_LOG(Warn, category)
#define LOG_ERROR(category) LOCKVAULT_LOG(Error, category)

} // namespace util
} // namespace lockvault

#endif // LOCKVAULT_UTIL_LOGGING_H

// LOCKVAULT - Logging Implementation
// Copyright (c) 2024 LOCKVAULT Developers
// MIT License

#include "lockvault/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace lockvault {
namespace util {

namespace {

// "2024-01-15 10:30:00.123 "
void AppendTimestamp(std::ostringstream& out, std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    std::tm tm_buf;
    localtime_r(&secs, &tm_buf);
    out << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << std::setfill(' ') << ' ';
}

// "WARN  vault: message", plus " (vault.cpp:42)" for file output
std::string FormatEntry(const LogEntry& entry, bool timestamp, bool location) {
    std::ostringstream out;
    if (timestamp) {
        AppendTimestamp(out, entry.timestamp);
    }
    out << std::left << std::setw(6) << LogLevelToString(entry.level);
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        out << entry.category << ": ";
    }
    out << entry.message;
    if (location && !entry.file.empty()) {
        size_t slash = entry.file.find_last_of('/');
        out << " (" << (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1))
            << ':' << entry.line << ')';
    }
    return out.str();
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error:
        case LogLevel::Fatal: return "\033[31m";
        default:              return "";
    }
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default:              return "UNKNOWN";
    }
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(const Options& options)
    : LogSink(options.level), options_(options) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatEntry(entry, options_.timestamps, false);

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = options_.colors && isatty(fileno(stderr)) ? ColorFor(entry.level) : "";
    if (*color) {
        std::fprintf(stderr, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Options& options)
    : LogSink(options.level), options_(options) {
    if (options_.path.empty()) {
        return;
    }
    file_.open(options_.path, std::ios::out | std::ios::app);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        size_ = static_cast<size_t>(file_.tellp());
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatEntry(entry, true, true);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (options_.maxSize > 0 && size_ + line.size() > options_.maxSize) {
        Rotate();
    }
    file_ << line;
    size_ += line.size();
    // Errors reach the disk even if the process dies right after
    if (entry.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::Rotate() {
    file_.close();
    const std::string& path = options_.path;
    if (options_.maxFiles > 0) {
        std::remove((path + "." + std::to_string(options_.maxFiles)).c_str());
        for (size_t i = options_.maxFiles; i > 1; --i) {
            std::rename((path + "." + std::to_string(i - 1)).c_str(),
                        (path + "." + std::to_string(i)).c_str());
        }
        std::rename(path.c_str(), (path + ".1").c_str());
    }
    file_.open(path, std::ios::out | std::ios::trunc);
    size_ = 0;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.insert(category);
    allCategories_.store(false);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
    allCategories_.store(true);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategories_.load()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= level_.load() && IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace lockvault

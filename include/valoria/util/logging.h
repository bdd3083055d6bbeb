// VALORIA - Logging System
// Copyright (c) 2024 VALORIA Developers
// MIT License
//
// Process-wide logger with per-subsystem categories. Entries fan out to the
// installed sinks: the console (stderr, so command output on stdout stays
// clean), a size-rotated debug.log, or a callback used by tests.

#ifndef VALORIA_UTIL_LOGGING_H
#define VALORIA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace valoria {
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

/// Case-insensitive; accepts the `debug=` config values "0" and "1".
/// Unrecognised text maps to Info.
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* ORACLE = "oracle";        // registry and admin changes
    constexpr const char* LEDGER = "ledger";        // submissions and activity
    constexpr const char* CONSENSUS = "consensus";  // aggregation and commits
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Entries and Formatting
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// One line, no trailing newline
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

std::string GetBasename(const std::string& path);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};   // only when stderr is a terminal
        LogFormat format;
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * Appends to a log file. Once the file reaches maxSize it is renamed to
 * path.1 (older copies shift to path.2 ... path.maxFiles, the oldest is
 * dropped) and a fresh file is started. A sink whose file cannot be opened
 * discards everything; check IsOpen() after construction.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogFormat format{true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const std::string& path);
    explicit FileSink(const Config& config);

    bool IsOpen() const;
    size_t GetCurrentSize() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void OpenForAppend();
    void Rotate();
};

class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Cheap pre-check used by the macros before building a message
    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::set<std::string> disabledCategories_;
    mutable std::mutex categoriesMutex_;
};

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, std::string category, const char* file, int line)
        : level_(level), category_(std::move(category)), file_(file), line_(line) {}
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
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define VALORIA_LOGGER ::valoria::util::Logger::Instance()

#define VALORIA_LOG(level, category) \
    if (!VALORIA_LOGGER.WillLog(::valoria::util::LogLevel::level, category)) {} else \
        ::valoria::util::LogStream(::valoria::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   VALORIA_LOG(Trace, category)
#define LOG_DEBUG(category)   VALORIA_LOG(Debug, category)
#define LOG_INFO(category)    VALORIA_LOG(Info, category)
#define LOG_WARN(category)    VALORIA_LOG(Warn, category)
#define LOG_ERROR(category)   VALORIA_LOG(Error, category)

#define VALORIA_LOGF(level, category, ...) \
    do { \
        if (VALORIA_LOGGER.WillLog(::valoria::util::LogLevel::level, category)) { \
            VALORIA_LOGGER.LogF(::valoria::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogInfoF(category, ...)   VALORIA_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   VALORIA_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  VALORIA_LOGF(Error, category, __VA_ARGS__)

} // namespace util
} // namespace valoria

#endif // VALORIA_UTIL_LOGGING_H

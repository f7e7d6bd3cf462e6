// VELOCK - Logging System
// Copyright (c) 2024 VELOCK Developers
// MIT License
//
// Leveled, categorized logging for the ledger engine:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories per subsystem (stake, governance, asset, db, ...)
// - Console, rotating file and callback sinks
// - Stream-style and printf-style macros

#ifndef VELOCK_UTIL_LOGGING_H
#define VELOCK_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace velock {
namespace util {

// ============================================================================
// Log Levels
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

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, "warning" accepted).
/// Unknown names yield Info.
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAKE = "stake";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* ASSET = "asset";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showThread{false};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sink Interface
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Writes to stdout; Error and Fatal optionally go to stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
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

// ============================================================================
// File Sink
// ============================================================================

/// Appends to a log file, rotating to path.1 .. path.N once maxSize is hit
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool rotate{true};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    FileSink() = default;
    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }
    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    /// Caller holds mutex_
    bool OpenLocked();
    void Rotate();
};

// ============================================================================
// Callback Sink
// ============================================================================

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

    /// Install a default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories. Until the first call
    /// every category is enabled.
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    std::atomic<bool> allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category,
              const char* file, int line, const char* function);
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
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define VELOCK_LOGGER ::velock::util::Logger::Instance()

#define VELOCK_LOG_ENABLED(level, category) \
    VELOCK_LOGGER.WillLog(::velock::util::LogLevel::level, category)

#define VELOCK_LOG(level, category) \
    if (!VELOCK_LOG_ENABLED(level, category)) {} else \
        ::velock::util::LogStream(::velock::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   VELOCK_LOG(Trace, category)
#define LOG_DEBUG(category)   VELOCK_LOG(Debug, category)
#define LOG_INFO(category)    VELOCK_LOG(Info, category)
#define LOG_WARN(category)    VELOCK_LOG(Warn, category)
#define LOG_ERROR(category)   VELOCK_LOG(Error, category)
#define LOG_FATAL(category)   VELOCK_LOG(Fatal, category)

#define VELOCK_LOGF(level, category, ...) \
    do { \
        if (VELOCK_LOG_ENABLED(level, category)) { \
            VELOCK_LOGGER.LogF(::velock::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogTraceF(category, ...)  VELOCK_LOGF(Trace, category, __VA_ARGS__)
#define LogDebugF(category, ...)  VELOCK_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   VELOCK_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   VELOCK_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  VELOCK_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "<operation> took Nms" at Debug when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define VELOCK_LOG_CONCAT_INNER(a, b) a##b
#define VELOCK_LOG_CONCAT(a, b) VELOCK_LOG_CONCAT_INNER(a, b)
#define VELOCK_LOG_TIMER(category, operation) \
    ::velock::util::ScopedLogTimer VELOCK_LOG_CONCAT(velock_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Final path component ("src/staking/ledger.cpp" -> "ledger.cpp")
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace velock

#endif // VELOCK_UTIL_LOGGING_H

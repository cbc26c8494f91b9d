// TypeProof - Logging System
// Copyright (c) 2024 TypeProof Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Levels TRACE..FATAL, plus OFF
// - Per-category muting
// - Console, file and callback sinks
// - Stream-style and printf-style macros

#ifndef TYPEPROOF_UTIL_LOGGING_H
#define TYPEPROOF_UTIL_LOGGING_H

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

namespace typeproof {
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

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* PROVER = "prover";
    constexpr const char* PROOF = "proof";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
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

/// Which parts of an entry a sink prints
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
// Sinks
// ============================================================================

/// Destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for warnings and above when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        LogFormat format;
        bool useColors{true};
        bool useStderr{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool append{true};
        bool autoFlush{false};
        LogFormat format{true, true, true, true, true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a callback (tests, embedding hosts)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

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

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Mute or unmute a category
    void MuteCategory(const std::string& category);
    void UnmuteCategory(const std::string& category);
    bool IsCategoryMuted(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

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
    std::unordered_set<std::string> mutedCategories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and emits it on destruction
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
// Macros
// ============================================================================

#define TYPEPROOF_LOGGER ::typeproof::util::Logger::Instance()

#define TYPEPROOF_LOG_ENABLED(level, category) \
    TYPEPROOF_LOGGER.WillLog(::typeproof::util::LogLevel::level, category)

#define TYPEPROOF_LOG(level, category) \
    if (!TYPEPROOF_LOG_ENABLED(level, category)) {} else \
        ::typeproof::util::LogStream(::typeproof::util::LogLevel::level, category, \
                                     __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   TYPEPROOF_LOG(Trace, category)
#define LOG_DEBUG(category)   TYPEPROOF_LOG(Debug, category)
#define LOG_INFO(category)    TYPEPROOF_LOG(Info, category)
#define LOG_WARN(category)    TYPEPROOF_LOG(Warn, category)
#define LOG_ERROR(category)   TYPEPROOF_LOG(Error, category)
#define LOG_FATAL(category)   TYPEPROOF_LOG(Fatal, category)

#define TYPEPROOF_LOGF(level, category, ...) \
    do { \
        if (TYPEPROOF_LOG_ENABLED(level, category)) { \
            TYPEPROOF_LOGGER.LogF(::typeproof::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  TYPEPROOF_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   TYPEPROOF_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   TYPEPROOF_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  TYPEPROOF_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the wall time of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

    /// Milliseconds since construction
    int64_t ElapsedMs() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace typeproof

#endif // TYPEPROOF_UTIL_LOGGING_H

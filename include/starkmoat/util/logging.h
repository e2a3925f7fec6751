// STARKMOAT - Logging System
// Copyright (c) 2024 STARKMOAT Developers
// MIT License
//
// Leveled, categorized logging routed to pluggable sinks (console, file,
// callback). Stream-style and printf-style macros are provided.

#ifndef STARKMOAT_UTIL_LOGGING_H
#define STARKMOAT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace starkmoat {
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

/// Upper-case name of a level ("INFO")
const char* LogLevelToString(LogLevel level);

/// Parse a level name, case-insensitive. "warning" is accepted for Warn.
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* NULLIFIER = "nullifier";
    constexpr const char* SIGNAL = "signal";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
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
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

/// Which fields a sink prints in front of the message
struct LogFormat {
    bool showTimestamp{true};
    bool showLevel{true};
    bool showCategory{true};
    bool showLocation{false};
};

/// Render an entry as a single line (no trailing newline)
std::string FormatLogEntry(const LogEntry& entry, const LogFormat& format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;
    
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

protected:
    bool Accepts(const LogEntry& entry) const { return entry.level >= level_.load(); }

private:
    std::atomic<LogLevel> level_{LogLevel::Trace};
};

/// Writes to stdout, errors optionally to stderr, colored on a terminal
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        LogFormat format;
    };
    
    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    
    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating it to path.1, path.2, ... past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{3};
        LogFormat format{true, true, true, true};
    };
    
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    bool IsOpen() const;
    const std::string& GetPath() const { return config_.path; }
    
    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
    
    void OpenLocked();
    void RotateLocked();
};

/// Hands every entry to a callback; used by tests and embedders
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}
    
    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Starts with no sinks, so nothing is printed until
/// a sink is added.
class Logger {
public:
    static Logger& Instance();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    
    /// Restrict output to the named categories (all are enabled by default)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;
    
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
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    bool allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and logs it on destruction
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

// ============================================================================
// Logging Macros
// ============================================================================

#define STARKMOAT_LOGGER ::starkmoat::util::Logger::Instance()

#define STARKMOAT_LOG_ENABLED(level, category) \
    STARKMOAT_LOGGER.WillLog(::starkmoat::util::LogLevel::level, category)

#define STARKMOAT_LOG(level, category) \
    if (!STARKMOAT_LOG_ENABLED(level, category)) {} else \
        ::starkmoat::util::LogStream(::starkmoat::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   STARKMOAT_LOG(Trace, category)
#define LOG_DEBUG(category)   STARKMOAT_LOG(Debug, category)
#define LOG_INFO(category)    STARKMOAT_LOG(Info, category)
#define LOG_WARN(category)    STARKMOAT_LOG(Warn, category)
#define LOG_ERROR(category)   STARKMOAT_LOG(Error, category)

#define LogInfo()   LOG_INFO(::starkmoat::util::LogCategory::DEFAULT)
#define LogWarn()   LOG_WARN(::starkmoat::util::LogCategory::DEFAULT)
#define LogError()  LOG_ERROR(::starkmoat::util::LogCategory::DEFAULT)

#define STARKMOAT_LOGF(level, category, ...) \
    do { \
        if (STARKMOAT_LOG_ENABLED(level, category)) { \
            STARKMOAT_LOGGER.LogF(::starkmoat::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  STARKMOAT_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   STARKMOAT_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   STARKMOAT_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  STARKMOAT_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Setup
// ============================================================================

/// Logging settings, normally filled from the config file
struct LogSettings {
    LogLevel level{LogLevel::Info};
    bool printToConsole{true};
    std::string logFile;   // empty: no file sink
};

/**
 * Replace the logger's sinks according to settings.
 * @return false if the log file could not be opened (console logging is
 *         still installed when requested)
 */
bool SetupLogging(const LogSettings& settings);

} // namespace util
} // namespace starkmoat

#endif // STARKMOAT_UTIL_LOGGING_H

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace spv {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

struct LogEntry {
    LogLevel level = LogLevel::INFO;
    std::chrono::system_clock::time_point timestamp;
    std::string component;
    std::string message;
    std::string file;
    std::uint32_t line = 0;
};

// "2026-01-02 03:04:05.678 [ WARN] [state.fees] message (file.cc:42)"
[[nodiscard]] std::string format_log_entry(const LogEntry& entry, bool with_location);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() {}
};

// stderr, optionally colored by level
class ConsoleSink : public LogSink {
public:
    ConsoleSink(bool use_colors, bool show_source_location);

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    bool use_colors_;
    bool show_source_location_;
    std::mutex mutex_;
};

// Appends to a single file; the host ledger owns retention
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogEntry& entry) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return file_ != nullptr; }

private:
    std::FILE* file_ = nullptr;
    std::mutex mutex_;
};

// Keeps entries for an embedder to forward into its own log
class MemorySink : public LogSink {
public:
    void write(const LogEntry& entry) override;

    [[nodiscard]] std::vector<LogEntry> entries() const;
    [[nodiscard]] bool contains(std::string_view needle) const;

private:
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    void set_component_level(std::string component, LogLevel level);
    void add_sink(std::shared_ptr<LogSink> sink);

    // Drops every sink and component override
    void reset();

    // A component without an override inherits from its dotted parent
    // ("chain.reorg" -> "chain"), then from the global level.
    [[nodiscard]] bool is_enabled(LogLevel level, std::string_view component) const;

    void write(LogLevel level,
               std::string_view component,
               std::string message,
               const std::source_location& loc);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::map<std::string, LogLevel, std::less<>> component_levels_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Component Loggers
// ============================================================================

class ComponentLogger;

// Buffers one message and hands it to the Logger when destroyed
class LogStream {
public:
    LogStream(const ComponentLogger& owner, LogLevel level, const std::source_location& loc);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            buffer_ << value;
        }
        return *this;
    }

private:
    const ComponentLogger& owner_;
    LogLevel level_;
    std::source_location loc_;
    std::ostringstream buffer_;
    bool enabled_;
};

class ComponentLogger {
public:
    explicit ComponentLogger(std::string component) : component_(std::move(component)) {}

    [[nodiscard]] const std::string& name() const { return component_; }
    [[nodiscard]] bool enabled(LogLevel level) const {
        return Logger::instance().is_enabled(level, component_);
    }

    LogStream trace(const std::source_location& loc = std::source_location::current()) const {
        return LogStream(*this, LogLevel::TRACE, loc);
    }
    LogStream debug(const std::source_location& loc = std::source_location::current()) const {
        return LogStream(*this, LogLevel::DEBUG, loc);
    }
    LogStream info(const std::source_location& loc = std::source_location::current()) const {
        return LogStream(*this, LogLevel::INFO, loc);
    }
    LogStream warn(const std::source_location& loc = std::source_location::current()) const {
        return LogStream(*this, LogLevel::WARN, loc);
    }
    LogStream error(const std::source_location& loc = std::source_location::current()) const {
        return LogStream(*this, LogLevel::ERROR, loc);
    }

private:
    std::string component_;
};

// Skip formatting entirely when the level is filtered out
#define SPV_LOG_TRACE(logger) if ((logger).enabled(::spv::LogLevel::TRACE)) (logger).trace()
#define SPV_LOG_DEBUG(logger) if ((logger).enabled(::spv::LogLevel::DEBUG)) (logger).debug()
#define SPV_LOG_INFO(logger)  if ((logger).enabled(::spv::LogLevel::INFO)) (logger).info()
#define SPV_LOG_WARN(logger)  if ((logger).enabled(::spv::LogLevel::WARN)) (logger).warn()
#define SPV_LOG_ERROR(logger) if ((logger).enabled(::spv::LogLevel::ERROR)) (logger).error()

namespace log {

inline ComponentLogger core("core");
inline ComponentLogger crypto("crypto");
inline ComponentLogger chain("chain");
inline ComponentLogger reorg("chain.reorg");
inline ComponentLogger fees("state.fees");
inline ComponentLogger bridge("bridge");
inline ComponentLogger verify("bridge.verify");

}  // namespace log

// ============================================================================
// Configuration
// ============================================================================

struct LogConfig {
    LogLevel default_level = LogLevel::INFO;
    std::map<std::string, LogLevel> component_levels;

    bool console_enabled = true;
    bool console_colors = true;
    bool console_source_location = false;

    bool file_enabled = false;
    std::string file_path = "spvrelay.log";

    // Host-supplied sinks, installed after console and file
    std::vector<std::shared_ptr<LogSink>> sinks;
};

// Replaces the current logger setup. Returns false if the log file could
// not be opened; the remaining sinks are still installed.
bool init_logging(const LogConfig& config = LogConfig{});
void shutdown_logging();

}  // namespace spv

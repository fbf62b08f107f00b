#include "logging.hh"
#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace spv {

std::string format_log_entry(const LogEntry& entry, bool with_location) {
    auto seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
        << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (!entry.component.empty()) {
        out << " [" << entry.component << "]";
    }
    out << ' ' << entry.message;
    if (with_location && !entry.file.empty()) {
        out << " (" << entry.file << ':' << entry.line << ')';
    }
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

namespace {

constexpr const char* LEVEL_COLORS[] = {
    "\033[90m",   // TRACE
    "\033[36m",   // DEBUG
    "\033[32m",   // INFO
    "\033[33m",   // WARN
    "\033[31m",   // ERROR
    "",           // OFF
};

constexpr const char* COLOR_RESET = "\033[0m";

}  // namespace

ConsoleSink::ConsoleSink(bool use_colors, bool show_source_location)
    : use_colors_(use_colors)
    , show_source_location_(show_source_location) {}

void ConsoleSink::write(const LogEntry& entry) {
    std::string line = format_log_entry(entry, show_source_location_);

    std::lock_guard<std::mutex> lock(mutex_);
    if (use_colors_) {
        std::cerr << LEVEL_COLORS[static_cast<std::size_t>(entry.level)] << line << COLOR_RESET << '\n';
    } else {
        std::cerr << line << '\n';
    }
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path) : file_(std::fopen(path.c_str(), "a")) {}

FileSink::~FileSink() {
    if (file_) {
        std::fclose(file_);
    }
}

void FileSink::write(const LogEntry& entry) {
    std::string line = format_log_entry(entry, true);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fwrite(line.data(), 1, line.size(), file_);
    }
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fflush(file_);
    }
}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [needle](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    sinks_.push_back(std::make_shared<ConsoleSink>(true, false));
}

void Logger::set_component_level(std::string component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[std::move(component)] = level;
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    component_levels_.clear();
}

bool Logger::is_enabled(LogLevel level, std::string_view component) const {
    if (level == LogLevel::OFF) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string_view scope = component;
        while (!scope.empty() && !component_levels_.empty()) {
            auto it = component_levels_.find(scope);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
            auto dot = scope.rfind('.');
            scope = dot == std::string_view::npos ? std::string_view{} : scope.substr(0, dot);
        }
    }

    return level >= level_.load();
}

void Logger::write(LogLevel level,
                   std::string_view component,
                   std::string message,
                   const std::source_location& loc) {
    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.component = std::string(component);
    entry.message = std::move(message);
    entry.file = loc.file_name();
    entry.line = loc.line();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::LogStream(const ComponentLogger& owner, LogLevel level, const std::source_location& loc)
    : owner_(owner)
    , level_(level)
    , loc_(loc)
    , enabled_(owner.enabled(level)) {}

LogStream::~LogStream() {
    if (enabled_) {
        Logger::instance().write(level_, owner_.name(), buffer_.str(), loc_);
    }
}

// ============================================================================
// Configuration
// ============================================================================

bool init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.reset();
    logger.set_level(config.default_level);
    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    if (config.console_enabled) {
        logger.add_sink(std::make_shared<ConsoleSink>(config.console_colors,
                                                      config.console_source_location));
    }

    bool file_ok = true;
    if (config.file_enabled) {
        auto file = std::make_shared<FileSink>(config.file_path);
        file_ok = file->is_open();
        if (file_ok) {
            logger.add_sink(std::move(file));
        }
    }

    for (const auto& sink : config.sinks) {
        logger.add_sink(sink);
    }

    if (!file_ok) {
        log::core.error() << "Cannot open log file " << config.file_path;
    }
    SPV_LOG_DEBUG(log::core) << "Logging initialized at level "
                             << log_level_name(config.default_level);
    return file_ok;
}

void shutdown_logging() {
    Logger::instance().flush();
}

}  // namespace spv

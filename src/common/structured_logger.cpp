#include "structured_logger.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>

#ifdef _WIN32
#include <windows.h>
#endif

namespace deskpilot {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time_t);
#else
        localtime_r(&time_t, &local);
#endif
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG" || upper == "TRACE") return LogLevel::DEBUG;
    if (upper == "INFO" || upper == "INFORMATION") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL" || upper == "FATAL") return LogLevel::CRITICAL;
    return fallback;
}

// JsonLogFormatter implementation
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (!entry.component.empty()) {
        log_json["component"] = entry.component;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.operation_name.empty()) {
        log_json["operation"] = entry.operation_name;
        log_json["duration_ms"] = entry.duration.count() / 1000000.0;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return log_json.dump() + "\n";
}

// TextLogFormatter implementation
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    if (!entry.component.empty()) {
        ss << "[" << entry.component << "] ";
    }

    ss << entry.message;

    // Source location only for errors
    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.operation_name.empty()) {
        ss << " [" << entry.operation_name << ": "
           << std::fixed << std::setprecision(2)
           << (entry.duration.count() / 1000000.0) << "ms]";
    }

    if (!entry.context.empty()) {
        ss << " " << entry.context.dump();
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink implementation
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(std::move(formatter)) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);

    if (entry.level >= LogLevel::ERROR_LEVEL) {
#ifdef _WIN32
        HANDLE hConsole = GetStdHandle(STD_ERROR_HANDLE);
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_INTENSITY);
#endif
        std::cerr << formatted;
#ifdef _WIN32
        SetConsoleTextAttribute(hConsole, FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
#endif
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout.flush();
    std::cerr.flush();
}

// RotatingFileLogSink implementation
RotatingFileLogSink::RotatingFileLogSink(const Config& config,
                                         std::shared_ptr<ILogFormatter> formatter)
    : m_config(config), m_formatter(std::move(formatter)), m_current_size(0) {
    openFile();
}

RotatingFileLogSink::~RotatingFileLogSink() {
    if (m_file && m_file->is_open()) {
        m_file->close();
    }
}

void RotatingFileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_file || !m_file->is_open()) {
        openFile();
        if (!m_file->is_open()) {
            return;
        }
    }

    std::string formatted = m_formatter->format(entry);
    *m_file << formatted;
    m_current_size += formatted.size();

    rotateIfNeeded();
}

void RotatingFileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file && m_file->is_open()) {
        m_file->flush();
    }
}

void RotatingFileLogSink::rotateIfNeeded() {
    if (m_current_size < m_config.max_file_size) {
        return;
    }

    m_file->close();

    std::error_code ec;
    if (m_config.max_files > 0) {
        fs::remove(rotatedFileName(m_config.max_files), ec);
        for (size_t i = m_config.max_files; i > 1; --i) {
            if (fs::exists(rotatedFileName(i - 1), ec)) {
                fs::rename(rotatedFileName(i - 1), rotatedFileName(i), ec);
            }
        }
        fs::rename(m_config.base_path, rotatedFileName(1), ec);
    } else {
        fs::remove(m_config.base_path, ec);
    }

    if (ec) {
        std::cerr << "Log rotation failed for " << m_config.base_path << ": " << ec.message() << "\n";
    }

    openFile();
}

void RotatingFileLogSink::openFile() {
    fs::path path(m_config.base_path);
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    m_file = std::make_unique<std::ofstream>(m_config.base_path, std::ios::app);
    m_current_size = fs::exists(path, ec) ? static_cast<size_t>(fs::file_size(path, ec)) : 0;
}

std::string RotatingFileLogSink::rotatedFileName(size_t index) const {
    fs::path p(m_config.base_path);
    std::string stem = p.stem().string();
    std::string ext = p.extension().string();

    return (p.parent_path() / (stem + "." + std::to_string(index) + ext)).string();
}

// PerformanceTracker implementation
double PerformanceTracker::MetricsSnapshot::getAverageDurationMs() const {
    if (count == 0) return 0.0;
    return (static_cast<double>(total_duration_ns) / count) / 1000000.0;
}

nlohmann::json PerformanceTracker::MetricsSnapshot::toJson() const {
    nlohmann::json j;
    j["count"] = count;
    j["errors"] = errors;
    j["average_ms"] = getAverageDurationMs();
    j["min_ms"] = count == 0 ? 0.0 : min_duration_ns / 1000000.0;
    j["max_ms"] = max_duration_ns / 1000000.0;
    j["total_ms"] = total_duration_ns / 1000000.0;
    return j;
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::Metrics::snapshot() const {
    MetricsSnapshot result;
    result.count = count.load();
    result.total_duration_ns = total_duration_ns.load();
    result.min_duration_ns = min_duration_ns.load();
    result.max_duration_ns = max_duration_ns.load();
    result.errors = errors.load();
    return result;
}

void PerformanceTracker::recordOperation(const std::string& operation,
                                         std::chrono::nanoseconds duration,
                                         bool success) {
    Metrics* metrics = nullptr;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto& slot = m_metrics[operation];
        if (!slot) {
            slot = std::make_unique<Metrics>();
        }
        metrics = slot.get();
    }

    uint64_t dur = static_cast<uint64_t>(duration.count());
    metrics->count++;
    metrics->total_duration_ns += dur;

    uint64_t current_min = metrics->min_duration_ns.load();
    while (dur < current_min &&
           !metrics->min_duration_ns.compare_exchange_weak(current_min, dur)) {}

    uint64_t current_max = metrics->max_duration_ns.load();
    while (dur > current_max &&
           !metrics->max_duration_ns.compare_exchange_weak(current_max, dur)) {}

    if (!success) {
        metrics->errors++;
    }
}

PerformanceTracker::MetricsSnapshot PerformanceTracker::getMetrics(const std::string& operation) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    auto it = m_metrics.find(operation);
    if (it != m_metrics.end() && it->second) {
        return it->second->snapshot();
    }
    return MetricsSnapshot{};
}

std::unordered_map<std::string, PerformanceTracker::MetricsSnapshot>
PerformanceTracker::getAllMetrics() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);

    std::unordered_map<std::string, MetricsSnapshot> result;
    for (const auto& [op, metrics] : m_metrics) {
        if (metrics) {
            result[op] = metrics->snapshot();
        }
    }
    return result;
}

void PerformanceTracker::reset() {
    // Not safe while another thread is inside recordOperation
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_metrics.clear();
}

// ScopedTimer implementation
ScopedTimer::ScopedTimer(const std::string& operation_name)
    : m_operation_name(operation_name)
    , m_start(std::chrono::steady_clock::now())
    , m_success(true)
    , m_cancelled(false) {}

ScopedTimer::~ScopedTimer() {
    if (!m_cancelled && !m_operation_name.empty()) {
        auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - m_start);
        StructuredLogger::getInstance().logPerformance(m_operation_name, duration, m_success);
    }
}

// StructuredLogger implementation
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_min_level(LogLevel::INFO)
    , m_async_enabled(false)
    , m_log_queue(10000) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

StructuredLogger::~StructuredLogger() {
    shutdown();
}

void StructuredLogger::setLogLevel(LogLevel level) {
    m_min_level = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    return m_min_level.load();
}

bool StructuredLogger::isEnabled(LogLevel level) const {
    return !m_shutdown && level >= m_min_level.load();
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    m_sinks.clear();
}

void StructuredLogger::setAsyncLogging(bool async) {
    if (m_async_enabled == async) return;

    if (async) {
        m_stop_async = false;
        m_async_enabled = true;
        m_logging_thread = std::thread(&StructuredLogger::asyncLoggingLoop, this);
    } else {
        m_async_enabled = false;
        m_stop_async = true;
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
    }
}

void StructuredLogger::log(const LogEntry& entry) {
    if (!isEnabled(entry.level)) return;

    if (m_async_enabled) {
        m_log_queue.push(entry);
    } else {
        processLogEntry(entry);
    }
}

void StructuredLogger::log(LogLevel level, const std::string& message,
                           const nlohmann::json& context) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.thread_id = std::this_thread::get_id();
    entry.context = context;

    log(entry);
}

void StructuredLogger::logPerformance(const std::string& operation,
                                      std::chrono::nanoseconds duration,
                                      bool success) {
    m_performance_tracker.recordOperation(operation, duration, success);

    if (duration > std::chrono::milliseconds(m_slow_threshold_ms.load())) {
        LogEntry entry;
        entry.timestamp = std::chrono::system_clock::now();
        entry.level = LogLevel::WARNING;
        entry.message = "Slow operation detected";
        entry.operation_name = operation;
        entry.duration = duration;
        entry.thread_id = std::this_thread::get_id();

        log(entry);
    }
}

void StructuredLogger::setSlowOperationThreshold(std::chrono::milliseconds threshold) {
    m_slow_threshold_ms = threshold.count();
}

void StructuredLogger::shutdown() {
    if (m_shutdown.exchange(true)) {
        return;
    }

    if (m_async_enabled) {
        m_stop_async = true;
        if (m_logging_thread.joinable()) {
            m_logging_thread.join();
        }
        m_async_enabled = false;
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::flush() {
    if (m_async_enabled) {
        while (!m_log_queue.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void StructuredLogger::asyncLoggingLoop() {
    while (!m_stop_async) {
        auto entry_opt = m_log_queue.popWithTimeout(100);
        if (entry_opt) {
            processLogEntry(*entry_opt);
        }
    }

    // Drain whatever was queued before the stop request
    for (const auto& entry : m_log_queue.drain()) {
        processLogEntry(entry);
    }

    size_t dropped = m_log_queue.droppedCount();
    if (dropped > 0) {
        std::cerr << "Async logger dropped " << dropped << " entries under load\n";
    }
}

void StructuredLogger::processLogEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_config_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

// LogBuilder implementation
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger)
    , m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::component(const std::string& name) {
    m_entry.component = name;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::operation(const std::string& op) {
    m_entry.operation_name = op;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::duration(std::chrono::nanoseconds ns) {
    m_entry.duration = ns;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace deskpilot

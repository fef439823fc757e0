#ifndef DESKPILOT_STRUCTURED_LOGGER_H
#define DESKPILOT_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <atomic>
#include <unordered_map>
#include <thread>
#include <mutex>
#include <shared_mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>
#include "thread_safe_queue.h"

namespace deskpilot {

// Shared by the process logger and by script execution logs
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // Renamed to avoid Windows ERROR macro conflict
    CRITICAL
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a level name such as "debug", "INFO" or "warn"
 * @return fallback when the name is not recognised
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief Log entry structure with structured data
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string component;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    // Set when the entry reports a timed operation
    std::chrono::nanoseconds duration;
    std::string operation_name;

    LogEntry() : level(LogLevel::INFO), line(0), duration(0) {}
};

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line, for log shipping
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable single line format used on the console
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes INFO and below to stdout, ERROR and above to stderr
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief File log sink with size based rotation
 *
 * deskpilot.log is rotated to deskpilot.1.log, deskpilot.2.log, ... and the
 * oldest file beyond max_files is removed.
 */
class RotatingFileLogSink : public ILogSink {
public:
    struct Config {
        std::string base_path;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t max_files = 5;
    };

    RotatingFileLogSink(const Config& config, std::shared_ptr<ILogFormatter> formatter);
    ~RotatingFileLogSink();

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    Config m_config;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::unique_ptr<std::ofstream> m_file;
    std::mutex m_mutex;
    size_t m_current_size;

    void rotateIfNeeded();
    void openFile();
    std::string rotatedFileName(size_t index) const;
};

/**
 * @brief Aggregated timings per operation name (screen captures, image searches, ...)
 */
class PerformanceTracker {
public:
    struct MetricsSnapshot {
        uint64_t count = 0;
        uint64_t total_duration_ns = 0;
        uint64_t min_duration_ns = UINT64_MAX;
        uint64_t max_duration_ns = 0;
        uint64_t errors = 0;

        double getAverageDurationMs() const;
        nlohmann::json toJson() const;
    };

    void recordOperation(const std::string& operation,
                         std::chrono::nanoseconds duration,
                         bool success = true);

    MetricsSnapshot getMetrics(const std::string& operation) const;
    std::unordered_map<std::string, MetricsSnapshot> getAllMetrics() const;
    void reset();

private:
    struct Metrics {
        std::atomic<uint64_t> count{0};
        std::atomic<uint64_t> total_duration_ns{0};
        std::atomic<uint64_t> min_duration_ns{UINT64_MAX};
        std::atomic<uint64_t> max_duration_ns{0};
        std::atomic<uint64_t> errors{0};

        MetricsSnapshot snapshot() const;
    };

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, std::unique_ptr<Metrics>> m_metrics;
};

/**
 * @brief RAII timer feeding the logger's PerformanceTracker
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void markFailed() { m_success = false; }
    void cancel() { m_cancelled = true; }

private:
    std::string m_operation_name;
    std::chrono::steady_clock::time_point m_start;
    bool m_success;
    bool m_cancelled;
};

/**
 * @brief Process wide structured logger
 */
class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    bool isEnabled(LogLevel level) const;

    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(std::shared_ptr<ILogSink> sink);
    void clearSinks();
    void setAsyncLogging(bool async);

    void log(const LogEntry& entry);
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& context = {});

    // Operations slower than the threshold are reported as a warning
    void logPerformance(const std::string& operation,
                        std::chrono::nanoseconds duration,
                        bool success = true);
    void setSlowOperationThreshold(std::chrono::milliseconds threshold);

    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& component(const std::string& name);
        LogBuilder& file(const char* file, int line);
        LogBuilder& operation(const std::string& op);
        LogBuilder& duration(std::chrono::nanoseconds ns);

        ~LogBuilder();  // Logs on destruction

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    PerformanceTracker& getPerformanceTracker() { return m_performance_tracker; }

    void shutdown();
    void flush();

private:
    StructuredLogger();
    ~StructuredLogger();

    std::atomic<LogLevel> m_min_level;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_config_mutex;

    std::atomic<bool> m_async_enabled;
    ThreadSafeQueue<LogEntry> m_log_queue;
    std::thread m_logging_thread;
    std::atomic<bool> m_stop_async{false};
    std::atomic<bool> m_shutdown{false};

    PerformanceTracker m_performance_tracker;
    std::atomic<int64_t> m_slow_threshold_ms{250};

    void asyncLoggingLoop();
    void processLogEntry(const LogEntry& entry);
};

#define SLOG_DEBUG() deskpilot::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() deskpilot::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() deskpilot::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() deskpilot::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() deskpilot::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

#define SCOPED_TIMER(operation) deskpilot::ScopedTimer _scopedTimer(operation)

} // namespace deskpilot

#endif // DESKPILOT_STRUCTURED_LOGGER_H

#ifndef DESKPILOT_ERROR_HANDLER_H
#define DESKPILOT_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <stdexcept>
#include <deque>
#include <vector>
#include <mutex>
#include <chrono>

namespace deskpilot {

enum class ErrorType {
    SCRIPT_NOT_FOUND_ERROR,
    STEP_EXECUTION_ERROR,
    ITERATION_ERROR,
    RUN_ERROR,
    STORAGE_ERROR,
    INPUT_ERROR,
    CAPTURE_ERROR,
    RECOGNITION_ERROR,
    CONFIGURATION_ERROR,
    VALIDATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class DeskpilotException : public std::exception {
public:
    explicit DeskpilotException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType getType() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

/**
 * @brief Raised by ScriptExecutionEngine::start for an unknown script id
 */
class ScriptNotFoundException : public DeskpilotException {
public:
    explicit ScriptNotFoundException(const std::string& scriptId)
        : DeskpilotException(ErrorInfo(ErrorType::SCRIPT_NOT_FOUND_ERROR, ErrorSeverity::MEDIUM,
                                       "Script with ID " + scriptId + " not found", "", scriptId))
        , m_scriptId(scriptId) {}

    const std::string& getScriptId() const { return m_scriptId; }

private:
    std::string m_scriptId;
};

/**
 * @brief Unwinds a run whose cancellation token fired during a wait
 *
 * Not derived from DeskpilotException: cancellation is not an error and the
 * step level handlers must let it through.
 */
class OperationCancelledException : public std::runtime_error {
public:
    OperationCancelledException() : std::runtime_error("Operation cancelled") {}
};

/**
 * @brief Central error sink: logs reported errors and keeps a bounded history
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "");

    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    size_t getErrorCount(ErrorType type) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t maxSize);

    static std::string errorTypeToString(ErrorType type);
    static std::string errorSeverityToString(ErrorSeverity severity);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    mutable std::mutex m_mutex;
    std::deque<ErrorInfo> m_errorHistory;
    size_t m_maxHistorySize = 1000;

    void logError(const ErrorInfo& error);
};

#define DESKPILOT_THROW(type, severity, message, details, context) \
    throw deskpilot::DeskpilotException(deskpilot::ErrorInfo(type, severity, message, details, context))

#define DESKPILOT_HANDLE_ERROR(type, severity, message, details, context) \
    deskpilot::ErrorHandler::getInstance().handleError(deskpilot::ErrorInfo(type, severity, message, details, context))

#define DESKPILOT_TRY_CATCH(code, context) \
    try { \
        code; \
    } catch (const std::exception& e) { \
        deskpilot::ErrorHandler::getInstance().handleException(e, context); \
    }

} // namespace deskpilot

#endif // DESKPILOT_ERROR_HANDLER_H

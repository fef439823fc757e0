#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace deskpilot {

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        while (m_errorHistory.size() > m_maxHistorySize) {
            m_errorHistory.pop_front();
        }
    }

    logError(error);
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context) {
    const auto* known = dynamic_cast<const DeskpilotException*>(&e);
    if (known) {
        ErrorInfo info = known->getErrorInfo();
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        handleError(ErrorInfo(ErrorType::UNKNOWN_ERROR, ErrorSeverity::HIGH, e.what(), "", context));
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    LogLevel level = LogLevel::INFO;
    switch (error.severity) {
        case ErrorSeverity::LOW: level = LogLevel::DEBUG; break;
        case ErrorSeverity::MEDIUM: level = LogLevel::WARNING; break;
        case ErrorSeverity::HIGH: level = LogLevel::ERROR_LEVEL; break;
        case ErrorSeverity::CRITICAL: level = LogLevel::CRITICAL; break;
    }

    StructuredLogger::LogBuilder builder(&StructuredLogger::getInstance(), level);
    builder.file(__FILE__, __LINE__)
        .component("errors")
        .message(logMessage.str())
        .context("error_type", errorTypeToString(error.type))
        .context("severity", errorSeverityToString(error.severity));
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + static_cast<std::ptrdiff_t>(start),
                                  m_errorHistory.end());
}

size_t ErrorHandler::getErrorCount(ErrorType type) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& error : m_errorHistory) {
        if (error.type == type) {
            ++count;
        }
    }
    return count;
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

void ErrorHandler::setMaxHistorySize(size_t maxSize) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxHistorySize = maxSize;
    while (m_errorHistory.size() > m_maxHistorySize) {
        m_errorHistory.pop_front();
    }
}

std::string ErrorHandler::errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::SCRIPT_NOT_FOUND_ERROR: return "SCRIPT_NOT_FOUND";
        case ErrorType::STEP_EXECUTION_ERROR: return "STEP_EXECUTION";
        case ErrorType::ITERATION_ERROR: return "ITERATION";
        case ErrorType::RUN_ERROR: return "RUN";
        case ErrorType::STORAGE_ERROR: return "STORAGE";
        case ErrorType::INPUT_ERROR: return "INPUT";
        case ErrorType::CAPTURE_ERROR: return "CAPTURE";
        case ErrorType::RECOGNITION_ERROR: return "RECOGNITION";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::VALIDATION_ERROR: return "VALIDATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

std::string ErrorHandler::errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

} // namespace deskpilot

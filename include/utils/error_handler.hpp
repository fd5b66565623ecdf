#pragma once

#include <string>
#include <exception>
#include <memory>
#include <functional>
#include <chrono>
#include <map>
#include <mutex>
#include <vector>

namespace medscribe {
namespace utils {

/**
 * Error severity levels
 */
enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

/**
 * Error categories, one per pipeline stage
 */
enum class ErrorCategory {
    AUDIO_PROCESSING,
    RECOGNITION,
    GENERATION,
    RENDERING,
    CONFIGURATION,
    PIPELINE,
    SYSTEM,
    UNKNOWN
};

/**
 * Structured error information
 */
struct ErrorInfo {
    std::string id;
    ErrorCategory category;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::steady_clock::time_point timestamp;
    std::string owner_id;

    ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "",
              const std::string& owner = "");
};

/**
 * Base exception for everything the pipeline throws
 */
class MedScribeException : public std::exception {
public:
    explicit MedScribeException(const ErrorInfo& error_info);
    const char* what() const noexcept override;
    const ErrorInfo& getErrorInfo() const { return error_info_; }

private:
    ErrorInfo error_info_;
    mutable std::string what_message_;
};

class AudioProcessingException : public MedScribeException {
public:
    AudioProcessingException(const std::string& message, const std::string& context = "");
};

/**
 * Unreadable audio. TOO_SMALL is terminal for the recording; UNDECODABLE lets the
 * caller keep the original bytes for the recognition fallback chain.
 */
class DecodeException : public AudioProcessingException {
public:
    enum class Reason {
        TOO_SMALL,
        UNDECODABLE
    };

    DecodeException(Reason reason, const std::string& message);
    Reason getReason() const { return reason_; }

private:
    Reason reason_;
};

class RecognitionException : public MedScribeException {
public:
    RecognitionException(const std::string& message, const std::string& context = "");
};

class GenerationException : public MedScribeException {
public:
    GenerationException(const std::string& message, const std::string& details = "");
};

class RenderException : public MedScribeException {
public:
    RenderException(const std::string& message, const std::string& encoding = "");
};

class ConfigurationException : public MedScribeException {
public:
    ConfigurationException(const std::string& message, const std::string& details = "");
};

class PipelineException : public MedScribeException {
public:
    PipelineException(const std::string& message, const std::string& stage = "");
};

/**
 * Error handler callback type
 */
using ErrorCallback = std::function<void(const ErrorInfo&)>;

/**
 * Central error handler. Records contained failures (those that become transcript
 * markers or silent fallbacks) so they stay observable.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    // Error reporting
    void reportError(const ErrorInfo& error);
    void reportError(const std::exception& e, const std::string& context = "",
                     const std::string& owner_id = "");

    void setErrorCallback(ErrorCallback callback);

    // Error statistics
    size_t getErrorCount(ErrorCategory category = ErrorCategory::UNKNOWN) const;
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    void clearErrorHistory();
    void setMaxHistorySize(size_t max_size);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    void logError(const ErrorInfo& error);

    ErrorCallback error_callback_;
    std::vector<ErrorInfo> error_history_;
    size_t max_history_size_ = 1000;

    mutable std::mutex mutex_;
};

/**
 * RAII error context manager
 */
class ErrorContext {
public:
    ErrorContext(const std::string& context, const std::string& owner_id = "");
    ~ErrorContext();

    ErrorContext(const ErrorContext&) = delete;
    ErrorContext& operator=(const ErrorContext&) = delete;

    static std::string getCurrentContext();
    static std::string getCurrentOwnerId();

private:
    std::string previous_context_;
    std::string previous_owner_id_;

    static thread_local std::string current_context_;
    static thread_local std::string current_owner_id_;
};

std::string categoryToString(ErrorCategory category);

/**
 * Utility macros for error handling
 */
#define MEDSCRIBE_REPORT_ERROR(category, severity, message, details) \
    do { \
        ::medscribe::utils::ErrorInfo error_info_(category, severity, message, details, \
                       ::medscribe::utils::ErrorContext::getCurrentContext(), \
                       ::medscribe::utils::ErrorContext::getCurrentOwnerId()); \
        ::medscribe::utils::ErrorHandler::getInstance().reportError(error_info_); \
    } while(0)

#define MEDSCRIBE_REPORT_EXCEPTION(e, context) \
    ::medscribe::utils::ErrorHandler::getInstance().reportError(e, context, \
        ::medscribe::utils::ErrorContext::getCurrentOwnerId())

} // namespace utils
} // namespace medscribe

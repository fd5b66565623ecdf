#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <sstream>
#include <iomanip>
#include <random>
#include <algorithm>
#include <mutex>

namespace medscribe {
namespace utils {

// Thread-local storage for error context
thread_local std::string ErrorContext::current_context_;
thread_local std::string ErrorContext::current_owner_id_;

// ErrorInfo implementation
ErrorInfo::ErrorInfo(ErrorCategory cat, ErrorSeverity sev, const std::string& msg,
                     const std::string& det, const std::string& ctx, const std::string& owner)
    : category(cat), severity(sev), message(msg), details(det), context(ctx),
      timestamp(std::chrono::steady_clock::now()), owner_id(owner) {

    // Generate unique error ID
    static std::mutex id_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << "err_";
    std::lock_guard<std::mutex> lock(id_mutex);
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    id = ss.str();
}

// MedScribeException implementation
MedScribeException::MedScribeException(const ErrorInfo& error_info)
    : error_info_(error_info) {
}

const char* MedScribeException::what() const noexcept {
    if (what_message_.empty()) {
        what_message_ = error_info_.message;
        if (!error_info_.details.empty()) {
            what_message_ += ": " + error_info_.details;
        }
    }
    return what_message_.c_str();
}

// Specific exception implementations
AudioProcessingException::AudioProcessingException(const std::string& message, const std::string& context)
    : MedScribeException(ErrorInfo(ErrorCategory::AUDIO_PROCESSING, ErrorSeverity::ERROR,
                                   message, "", context.empty() ? "AudioProcessing" : context)) {
}

DecodeException::DecodeException(Reason reason, const std::string& message)
    : AudioProcessingException(message, reason == Reason::TOO_SMALL ? "Decode:too_small" : "Decode:undecodable"),
      reason_(reason) {
}

RecognitionException::RecognitionException(const std::string& message, const std::string& context)
    : MedScribeException(ErrorInfo(ErrorCategory::RECOGNITION, ErrorSeverity::ERROR,
                                   message, "", context.empty() ? "Recognition" : context)) {
}

GenerationException::GenerationException(const std::string& message, const std::string& details)
    : MedScribeException(ErrorInfo(ErrorCategory::GENERATION, ErrorSeverity::ERROR,
                                   message, details, "Generation")) {
}

RenderException::RenderException(const std::string& message, const std::string& encoding)
    : MedScribeException(ErrorInfo(ErrorCategory::RENDERING, ErrorSeverity::ERROR,
                                   message, "", encoding.empty() ? "Rendering" : encoding)) {
}

ConfigurationException::ConfigurationException(const std::string& message, const std::string& details)
    : MedScribeException(ErrorInfo(ErrorCategory::CONFIGURATION, ErrorSeverity::CRITICAL,
                                   message, details, "Configuration")) {
}

PipelineException::PipelineException(const std::string& message, const std::string& stage)
    : MedScribeException(ErrorInfo(ErrorCategory::PIPELINE, ErrorSeverity::ERROR,
                                   message, "", stage.empty() ? "Pipeline" : stage)) {
}

// ErrorHandler implementation
ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::reportError(const ErrorInfo& error) {
    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        logError(error);

        error_history_.push_back(error);
        if (error_history_.size() > max_history_size_) {
            error_history_.erase(error_history_.begin());
        }
        callback = error_callback_;
    }

    if (callback) {
        try {
            callback(error);
        } catch (const std::exception& e) {
            Logger::error("Error in error callback: " + std::string(e.what()));
        }
    }
}

void ErrorHandler::reportError(const std::exception& e, const std::string& context,
                               const std::string& owner_id) {
    if (auto* known = dynamic_cast<const MedScribeException*>(&e)) {
        ErrorInfo error = known->getErrorInfo();
        if (!context.empty()) {
            error.context = context;
        }
        if (error.owner_id.empty()) {
            error.owner_id = owner_id;
        }
        reportError(error);
        return;
    }

    ErrorInfo error(ErrorCategory::UNKNOWN, ErrorSeverity::ERROR, e.what(), "", context, owner_id);
    reportError(error);
}

void ErrorHandler::setErrorCallback(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_callback_ = callback;
}

size_t ErrorHandler::getErrorCount(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (category == ErrorCategory::UNKNOWN) {
        return error_history_.size();
    }

    return std::count_if(error_history_.begin(), error_history_.end(),
                         [category](const ErrorInfo& error) {
                             return error.category == category;
                         });
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (error_history_.size() <= count) {
        return error_history_;
    }

    return std::vector<ErrorInfo>(error_history_.end() - count, error_history_.end());
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(mutex_);
    error_history_.clear();
}

void ErrorHandler::setMaxHistorySize(size_t max_size) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_history_size_ = max_size;
    while (error_history_.size() > max_history_size_) {
        error_history_.erase(error_history_.begin());
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    std::stringstream log_message;
    log_message << "[" << error.id << "] " << categoryToString(error.category) << " - " << error.message;

    if (!error.details.empty()) {
        log_message << " | Details: " << error.details;
    }

    if (!error.context.empty()) {
        log_message << " | Context: " << error.context;
    }

    if (!error.owner_id.empty()) {
        log_message << " | Owner: " << error.owner_id;
    }

    switch (error.severity) {
        case ErrorSeverity::INFO:
            Logger::info(log_message.str());
            break;
        case ErrorSeverity::WARNING:
            Logger::warn(log_message.str());
            break;
        case ErrorSeverity::ERROR:
        case ErrorSeverity::CRITICAL:
            Logger::error(log_message.str());
            break;
    }
}

// ErrorContext implementation
ErrorContext::ErrorContext(const std::string& context, const std::string& owner_id)
    : previous_context_(current_context_), previous_owner_id_(current_owner_id_) {
    current_context_ = context;
    if (!owner_id.empty()) {
        current_owner_id_ = owner_id;
    }
}

ErrorContext::~ErrorContext() {
    current_context_ = previous_context_;
    current_owner_id_ = previous_owner_id_;
}

std::string ErrorContext::getCurrentContext() {
    return current_context_;
}

std::string ErrorContext::getCurrentOwnerId() {
    return current_owner_id_;
}

std::string categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AUDIO_PROCESSING: return "Audio";
        case ErrorCategory::RECOGNITION: return "Recognition";
        case ErrorCategory::GENERATION: return "Generation";
        case ErrorCategory::RENDERING: return "Rendering";
        case ErrorCategory::CONFIGURATION: return "Configuration";
        case ErrorCategory::PIPELINE: return "Pipeline";
        case ErrorCategory::SYSTEM: return "System";
        case ErrorCategory::UNKNOWN: return "Unknown";
    }
    return "Unknown";
}

} // namespace utils
} // namespace medscribe

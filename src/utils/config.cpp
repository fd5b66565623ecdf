#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace medscribe {
namespace utils {

namespace {

using nlohmann::json;

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void readAudio(const json& j, AudioConfig& audio) {
    readValue(j, "sampleRate", audio.sampleRate);
    readValue(j, "minInputBytes", audio.minInputBytes);
    readValue(j, "longAudioThresholdMs", audio.longAudioThresholdMs);
    readValue(j, "segmentLengthMs", audio.segmentLengthMs);
    readValue(j, "normalizeHeadroomDb", audio.normalizeHeadroomDb);
    readValue(j, "enableExternalDecoder", audio.enableExternalDecoder);
    readValue(j, "ffmpegBinary", audio.ffmpegBinary);
}

void readRecognition(const json& j, RecognitionConfig& recognition) {
    readValue(j, "endpoint", recognition.endpoint);
    readValue(j, "apiKey", recognition.apiKey);
    readValue(j, "locale", recognition.locale);
    readValue(j, "calibrationMs", recognition.calibrationMs);
    readValue(j, "requestTimeoutMs", recognition.requestTimeoutMs);
    readValue(j, "deadlineStepMs", recognition.deadlineStepMs);
    readValue(j, "maxAttempts", recognition.maxAttempts);
    readValue(j, "retryBackoffMs", recognition.retryBackoffMs);
    readValue(j, "segmentWorkers", recognition.segmentWorkers);
}

void readGeneration(const json& j, GenerationConfig& generation) {
    readValue(j, "endpoint", generation.endpoint);
    readValue(j, "model", generation.model);
    readValue(j, "apiKey", generation.apiKey);
    readValue(j, "timeoutMs", generation.timeoutMs);
    readValue(j, "improveTranscripts", generation.improveTranscripts);
}

std::string joinErrors(const std::vector<std::string>& errors) {
    std::ostringstream ss;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) ss << "; ";
        ss << errors[i];
    }
    return ss.str();
}

} // namespace

PipelineConfig ConfigManager::load(const std::string& configPath) {
    PipelineConfig config;

    if (!std::filesystem::exists(configPath)) {
        Logger::info("Configuration file not found: " + configPath + ", using defaults");
        applyEnvironment(config);
        return config;
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file", configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::string jsonStr = buffer.str();
    if (jsonStr.find_first_not_of(" \t\r\n") == std::string::npos) {
        Logger::info("Empty configuration file, using defaults");
        applyEnvironment(config);
        return config;
    }

    config = parse(jsonStr);
    applyEnvironment(config);
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

PipelineConfig ConfigManager::parse(const std::string& jsonStr) {
    PipelineConfig config;

    try {
        json j = json::parse(jsonStr);
        if (!j.is_object()) {
            throw ConfigurationException("Configuration root must be a JSON object");
        }

        if (j.contains("audio")) readAudio(j["audio"], config.audio);
        if (j.contains("recognition")) readRecognition(j["recognition"], config.recognition);
        if (j.contains("generation")) readGeneration(j["generation"], config.generation);
        if (j.contains("export")) readValue(j["export"], "defaultTitle", config.exports.defaultTitle);
        if (j.contains("logging")) readValue(j["logging"], "level", config.logging.level);
    } catch (const json::exception& e) {
        throw ConfigurationException("Malformed configuration", e.what());
    }

    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        Logger::warn("Configuration warning: " + warning);
    }
    if (!validation.isValid) {
        throw ConfigurationException("Invalid configuration", joinErrors(validation.errors));
    }

    return config;
}

std::string ConfigManager::toJson(const PipelineConfig& config) {
    json j;
    j["audio"] = {
        {"sampleRate", config.audio.sampleRate},
        {"minInputBytes", config.audio.minInputBytes},
        {"longAudioThresholdMs", config.audio.longAudioThresholdMs},
        {"segmentLengthMs", config.audio.segmentLengthMs},
        {"normalizeHeadroomDb", config.audio.normalizeHeadroomDb},
        {"enableExternalDecoder", config.audio.enableExternalDecoder},
        {"ffmpegBinary", config.audio.ffmpegBinary}
    };
    // API keys are never written back out
    j["recognition"] = {
        {"endpoint", config.recognition.endpoint},
        {"locale", config.recognition.locale},
        {"calibrationMs", config.recognition.calibrationMs},
        {"requestTimeoutMs", config.recognition.requestTimeoutMs},
        {"deadlineStepMs", config.recognition.deadlineStepMs},
        {"maxAttempts", config.recognition.maxAttempts},
        {"retryBackoffMs", config.recognition.retryBackoffMs},
        {"segmentWorkers", config.recognition.segmentWorkers}
    };
    j["generation"] = {
        {"endpoint", config.generation.endpoint},
        {"model", config.generation.model},
        {"timeoutMs", config.generation.timeoutMs},
        {"improveTranscripts", config.generation.improveTranscripts}
    };
    j["export"] = {{"defaultTitle", config.exports.defaultTitle}};
    j["logging"] = {{"level", config.logging.level}};
    return j.dump(2);
}

ConfigValidationResult ConfigManager::validate(const PipelineConfig& config) {
    ConfigValidationResult result;

    if (config.audio.sampleRate != 16000) {
        result.addError("audio.sampleRate must be 16000 (canonical recognition rate)");
    }
    if (config.audio.minInputBytes == 0) {
        result.addWarning("audio.minInputBytes is 0; empty inputs will reach the decoder");
    }
    if (config.audio.segmentLengthMs <= 0) {
        result.addError("audio.segmentLengthMs must be positive");
    }
    if (config.audio.longAudioThresholdMs < config.audio.segmentLengthMs) {
        result.addError("audio.longAudioThresholdMs must not be shorter than audio.segmentLengthMs");
    }
    if (config.audio.normalizeHeadroomDb < 0.0f) {
        result.addError("audio.normalizeHeadroomDb must not be negative");
    }

    if (config.recognition.locale.empty()) {
        result.addError("recognition.locale must not be empty");
    }
    if (config.recognition.calibrationMs < 0) {
        result.addError("recognition.calibrationMs must not be negative");
    }
    if (config.recognition.requestTimeoutMs <= 0) {
        result.addError("recognition.requestTimeoutMs must be positive");
    }
    if (config.recognition.deadlineStepMs < 0) {
        result.addError("recognition.deadlineStepMs must not be negative");
    }
    if (config.recognition.maxAttempts < 1) {
        result.addError("recognition.maxAttempts must be at least 1");
    }
    if (config.recognition.retryBackoffMs < 0) {
        result.addError("recognition.retryBackoffMs must not be negative");
    }
    if (config.recognition.segmentWorkers < 1) {
        result.addError("recognition.segmentWorkers must be at least 1");
    } else if (config.recognition.segmentWorkers > 8) {
        result.addWarning("recognition.segmentWorkers above 8 is likely to hit service rate limits");
    }

    if (config.generation.model.empty()) {
        result.addError("generation.model must not be empty");
    }
    if (config.generation.timeoutMs <= 0) {
        result.addError("generation.timeoutMs must be positive");
    }

    if (config.exports.defaultTitle.empty()) {
        result.addWarning("export.defaultTitle is empty");
    }

    return result;
}

void ConfigManager::applyEnvironment(PipelineConfig& config) {
    if (config.recognition.apiKey.empty()) {
        if (const char* key = std::getenv("MEDSCRIBE_SPEECH_API_KEY")) {
            config.recognition.apiKey = key;
        }
    }
    if (config.generation.apiKey.empty()) {
        if (const char* key = std::getenv("GEMINI_API_KEY")) {
            config.generation.apiKey = key;
        }
    }
}

} // namespace utils
} // namespace medscribe

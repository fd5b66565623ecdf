#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace utils {

/**
 * Audio normalization and segmentation settings
 */
struct AudioConfig {
    int sampleRate = 16000;
    size_t minInputBytes = 1000;
    int64_t longAudioThresholdMs = 60000;
    int64_t segmentLengthMs = 45000;
    float normalizeHeadroomDb = 0.1f;
    bool enableExternalDecoder = true;
    std::string ffmpegBinary = "ffmpeg";
};

/**
 * Recognition client settings
 */
struct RecognitionConfig {
    std::string endpoint = "https://speech.googleapis.com/v1/speech:recognize";
    std::string apiKey;
    std::string locale = "pt-BR";
    int calibrationMs = 500;
    int requestTimeoutMs = 45000;
    int deadlineStepMs = 15000;
    int maxAttempts = 3;
    int retryBackoffMs = 2000;
    int segmentWorkers = 1;
};

/**
 * Generative-text service settings
 */
struct GenerationConfig {
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta/models";
    std::string model = "gemini-2.5-flash";
    std::string apiKey;
    int timeoutMs = 60000;
    bool improveTranscripts = true;
};

struct ExportConfig {
    std::string defaultTitle = "Resumo da Consulta";
};

struct LoggingConfig {
    std::string level = "INFO";
};

struct PipelineConfig {
    AudioConfig audio;
    RecognitionConfig recognition;
    GenerationConfig generation;
    ExportConfig exports;
    LoggingConfig logging;
};

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }
};

/**
 * Loads, validates and serializes PipelineConfig.
 */
class ConfigManager {
public:
    /**
     * Load configuration from a JSON file. A missing or empty file yields defaults.
     * Environment overrides are applied afterwards.
     * @throws ConfigurationException on malformed JSON or invalid values
     */
    static PipelineConfig load(const std::string& configPath);

    /**
     * Parse configuration from a JSON string. Keys absent from the document keep
     * their defaults.
     * @throws ConfigurationException on malformed JSON or invalid values
     */
    static PipelineConfig parse(const std::string& jsonStr);

    static std::string toJson(const PipelineConfig& config);

    static ConfigValidationResult validate(const PipelineConfig& config);

    /**
     * Fill empty API keys from MEDSCRIBE_SPEECH_API_KEY and GEMINI_API_KEY.
     */
    static void applyEnvironment(PipelineConfig& config);
};

} // namespace utils
} // namespace medscribe

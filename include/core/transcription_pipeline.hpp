#pragma once

#include "audio/audio_normalizer.hpp"
#include "audio/segmenter.hpp"
#include "core/recording_lock.hpp"
#include "refine/generative_service.hpp"
#include "refine/refinement_orchestrator.hpp"
#include "render/document_renderer.hpp"
#include "stt/recognition_client.hpp"
#include "stt/recognition_service.hpp"
#include "stt/transcript_fragment.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace medscribe {
namespace core {

/**
 * Result of one transcription run
 */
struct Transcript {
    std::string owner_id;
    std::string recording_id;

    // One per segment in temporal order; exactly one when unsegmented
    std::vector<stt::TranscriptFragment> fragments;

    std::string stitched_text;
    std::string text;           // stitched_text, or its improved version
    bool improved = false;

    std::chrono::system_clock::time_point created_at;

    bool hasFailures() const;
};

/**
 * Synchronous orchestrator of the audio-to-text flow:
 *
 *   normalize -> segment (long audio only) -> recognize -> stitch -> improve
 *
 * plus the explicit summarize and export steps. Operations on the same
 * recording id are serialized; runs on different recordings share nothing
 * mutable.
 */
class TranscriptionPipeline {
public:
    TranscriptionPipeline(const utils::PipelineConfig& config,
                          std::shared_ptr<stt::RecognitionService> recognition,
                          std::shared_ptr<refine::GenerativeService> generation,
                          std::shared_ptr<const audio::AudioNormalizer> normalizer = nullptr);

    // Non-copyable, non-movable
    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline(TranscriptionPipeline&&) = delete;
    TranscriptionPipeline& operator=(TranscriptionPipeline&&) = delete;

    /**
     * Pipeline wired to the HTTP speech and generative services named in the
     * configuration
     */
    static std::unique_ptr<TranscriptionPipeline> create(const utils::PipelineConfig& config);

    /**
     * Normalize only. Throws DecodeException for unusable input.
     */
    audio::RecordingPtr record(const std::vector<uint8_t>& raw, const audio::RecordingMetadata& metadata);

    /**
     * Full run over raw input bytes. Too-small input throws DecodeException;
     * undecodable input goes to recognition as raw bytes. Recognition failures
     * never throw: they end up as markers in the text.
     */
    Transcript transcribe(const std::vector<uint8_t>& raw, const audio::RecordingMetadata& metadata);

    Transcript transcribeRecording(const audio::RecordingPtr& recording);

    refine::RefinedText improve(const std::string& text) const;

    // Throws GenerationException when the service fails
    refine::Summary summarize(const std::string& text, const std::string& instruction = "") const;

    /**
     * Summarize the transcript stored under artifactName on behalf of its
     * owner. A summary that was not generated is an error here, so nothing
     * unsummarized is ever stored as a summary.
     * @throws utils::GenerationException when the service fails or skips
     * @throws utils::PipelineException unless ownerId owns artifactName
     */
    refine::Summary summarizeArtifact(const std::string& artifactName,
                                      const std::string& ownerId,
                                      const std::string& transcript,
                                      const std::string& instruction = "") const;

    /**
     * Render the summary markup stored under artifactName. The owner must own
     * the artifact; the title is derived from the subject in its name.
     */
    render::ExportedDocument exportSummary(const std::string& artifactName,
                                           const std::string& ownerId,
                                           const std::string& markup,
                                           render::DocumentEncoding encoding,
                                           std::chrono::system_clock::time_point timestamp =
                                               std::chrono::system_clock::now()) const;

    // Throws PipelineException unless ownerId owns artifactName
    void checkOwnership(const std::string& artifactName, const std::string& ownerId) const;

    stt::RecognitionClient& getRecognitionClient() { return *recognitionClient_; }
    RecordingLockRegistry& getLockRegistry() { return locks_; }
    const utils::PipelineConfig& getConfig() const { return config_; }

private:
    std::vector<stt::TranscriptFragment> recognizeSegments(const std::vector<audio::Segment>& segments) const;
    Transcript finish(const std::string& ownerId, const std::string& recordingId,
                      std::vector<stt::TranscriptFragment> fragments) const;

    utils::PipelineConfig config_;
    std::shared_ptr<const audio::AudioNormalizer> normalizer_;
    audio::Segmenter segmenter_;
    std::unique_ptr<stt::RecognitionClient> recognitionClient_;
    refine::RefinementOrchestrator refiner_;
    render::DocumentRenderer renderer_;
    RecordingLockRegistry locks_;
};

} // namespace core
} // namespace medscribe

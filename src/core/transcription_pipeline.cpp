#include "core/transcription_pipeline.hpp"
#include "core/artifact_naming.hpp"
#include "core/stitcher.hpp"
#include "core/task_queue.hpp"
#include "refine/gemini_service.hpp"
#include "stt/google_speech_service.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <future>

namespace medscribe {
namespace core {

bool Transcript::hasFailures() const {
    return std::any_of(fragments.begin(), fragments.end(), [](const stt::TranscriptFragment& fragment) {
        return fragment.kind != stt::FragmentKind::OK && fragment.kind != stt::FragmentKind::EMPTY;
    });
}

TranscriptionPipeline::TranscriptionPipeline(const utils::PipelineConfig& config,
                                             std::shared_ptr<stt::RecognitionService> recognition,
                                             std::shared_ptr<refine::GenerativeService> generation,
                                             std::shared_ptr<const audio::AudioNormalizer> normalizer)
    : config_(config)
    , normalizer_(normalizer ? std::move(normalizer)
                             : std::make_shared<const audio::AudioNormalizer>(config.audio))
    , segmenter_(config.audio)
    , recognitionClient_(new stt::RecognitionClient(std::move(recognition), config.recognition, config.audio))
    , refiner_(std::move(generation)) {
    utils::Logger::info("Transcription pipeline ready (locale " + config_.recognition.locale +
                        ", " + std::to_string(config_.recognition.segmentWorkers) + " segment worker(s), " +
                        "generative service " + (refiner_.isServiceAvailable() ? "available" : "unavailable") + ")");
}

std::unique_ptr<TranscriptionPipeline> TranscriptionPipeline::create(const utils::PipelineConfig& config) {
    auto recognition = std::make_shared<stt::GoogleSpeechService>(config.recognition);
    auto generation = std::make_shared<refine::GeminiService>(config.generation);
    return std::unique_ptr<TranscriptionPipeline>(new TranscriptionPipeline(config, recognition, generation));
}

audio::RecordingPtr TranscriptionPipeline::record(const std::vector<uint8_t>& raw,
                                                  const audio::RecordingMetadata& metadata) {
    utils::ErrorContext context("record", metadata.ownerId);
    auto guard = locks_.acquire(metadata.id);
    return normalizer_->normalize(raw, metadata);
}

Transcript TranscriptionPipeline::transcribe(const std::vector<uint8_t>& raw,
                                             const audio::RecordingMetadata& metadata) {
    utils::ErrorContext context("transcribe", metadata.ownerId);
    auto guard = locks_.acquire(metadata.id);

    utils::Logger::info("Transcribing " + metadata.id + " (" + std::to_string(raw.size()) + " bytes)");

    audio::RecordingPtr recording;
    try {
        recording = normalizer_->normalize(raw, metadata);
    } catch (const utils::DecodeException& e) {
        MEDSCRIBE_REPORT_EXCEPTION(e, "transcribe");
        if (e.getReason() == utils::DecodeException::Reason::TOO_SMALL) {
            throw;
        }

        utils::Logger::warn("Recording " + metadata.id +
                            " could not be normalized, sending original bytes to recognition");
        std::vector<stt::TranscriptFragment> fragments;
        fragments.push_back(recognitionClient_->recognizeBytes(stt::TranscriptFragment::kWholeIndex, raw));
        return finish(metadata.ownerId, metadata.id, std::move(fragments));
    }

    std::vector<audio::Segment> segments = segmenter_.segment(recording);
    return finish(metadata.ownerId, metadata.id, recognizeSegments(segments));
}

Transcript TranscriptionPipeline::transcribeRecording(const audio::RecordingPtr& recording) {
    if (!recording) {
        throw utils::PipelineException("Cannot transcribe a null recording", "transcribe");
    }

    utils::ErrorContext context("transcribe", recording->ownerId);
    auto guard = locks_.acquire(recording->id);

    std::vector<audio::Segment> segments = segmenter_.segment(recording);
    return finish(recording->ownerId, recording->id, recognizeSegments(segments));
}

std::vector<stt::TranscriptFragment> TranscriptionPipeline::recognizeSegments(
        const std::vector<audio::Segment>& segments) const {
    std::vector<stt::TranscriptFragment> fragments;
    fragments.reserve(segments.size());

    size_t workers = static_cast<size_t>(std::max(1, config_.recognition.segmentWorkers));
    workers = std::min(workers, segments.size());

    if (workers <= 1) {
        for (const auto& segment : segments) {
            fragments.push_back(recognitionClient_->recognize(segment));
        }
        return fragments;
    }

    utils::Logger::debug("Recognizing " + std::to_string(segments.size()) + " segments with " +
                         std::to_string(workers) + " workers");

    const std::string ownerId = utils::ErrorContext::getCurrentOwnerId();
    auto queue = std::make_shared<TaskQueue>();
    ThreadPool pool(workers);
    pool.start(queue);

    std::vector<std::future<stt::TranscriptFragment>> pending;
    pending.reserve(segments.size());
    for (const auto& segment : segments) {
        const stt::RecognitionClient* client = recognitionClient_.get();
        const audio::Segment* target = &segment;
        pending.push_back(queue->enqueueWithFuture([client, target, ownerId]() {
            utils::ErrorContext context("recognize", ownerId);
            return client->recognize(*target);
        }));
    }

    // Futures are collected in index order regardless of completion order
    std::exception_ptr failure;
    for (auto& future : pending) {
        try {
            fragments.push_back(future.get());
        } catch (const std::exception&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    pool.stop();

    if (failure) {
        std::rethrow_exception(failure);
    }
    return fragments;
}

Transcript TranscriptionPipeline::finish(const std::string& ownerId, const std::string& recordingId,
                                         std::vector<stt::TranscriptFragment> fragments) const {
    Transcript transcript;
    transcript.owner_id = ownerId;
    transcript.recording_id = recordingId;
    transcript.created_at = std::chrono::system_clock::now();
    transcript.stitched_text = Stitcher::stitch(fragments);
    transcript.fragments = std::move(fragments);
    transcript.text = transcript.stitched_text;

    if (config_.generation.improveTranscripts) {
        refine::RefinedText refined = refiner_.improve(transcript.stitched_text);
        transcript.text = refined.text;
        transcript.improved = refined.refined;
    }

    utils::Logger::info("Transcript for " + recordingId + " ready: " +
                        std::to_string(transcript.fragments.size()) + " fragment(s), " +
                        std::to_string(transcript.text.size()) + " chars" +
                        (transcript.hasFailures() ? ", with failure markers" : "") +
                        (transcript.improved ? ", improved" : ""));
    return transcript;
}

refine::RefinedText TranscriptionPipeline::improve(const std::string& text) const {
    return refiner_.improve(text);
}

refine::Summary TranscriptionPipeline::summarize(const std::string& text, const std::string& instruction) const {
    utils::ErrorContext context("summarize");
    return refiner_.summarize(text, instruction);
}

refine::Summary TranscriptionPipeline::summarizeArtifact(const std::string& artifactName,
                                                        const std::string& ownerId,
                                                        const std::string& transcript,
                                                        const std::string& instruction) const {
    utils::ErrorContext context("summarize", ownerId);
    checkOwnership(artifactName, ownerId);

    refine::Summary summary = refiner_.summarize(transcript, instruction);
    if (!summary.generated) {
        utils::GenerationException error("Summary was not generated for " + artifactName, summary.skipReason);
        MEDSCRIBE_REPORT_EXCEPTION(error, "summarize");
        throw error;
    }
    return summary;
}

void TranscriptionPipeline::checkOwnership(const std::string& artifactName, const std::string& ownerId) const {
    if (!ArtifactNaming::isOwnedBy(artifactName, ownerId)) {
        throw utils::PipelineException("Artifact " + artifactName + " does not belong to owner '" +
                                       ownerId + "'", "ownership");
    }
}

render::ExportedDocument TranscriptionPipeline::exportSummary(const std::string& artifactName,
                                                              const std::string& ownerId,
                                                              const std::string& markup,
                                                              render::DocumentEncoding encoding,
                                                              std::chrono::system_clock::time_point timestamp) const {
    utils::ErrorContext context("export", ownerId);
    checkOwnership(artifactName, ownerId);

    std::string subject = ArtifactNaming::subjectFromBase(ArtifactNaming::baseFromArtifact(artifactName), ownerId);
    std::string title = ArtifactNaming::exportTitle(subject, config_.exports.defaultTitle);

    try {
        return renderer_.render(markup, title, encoding, timestamp);
    } catch (const utils::RenderException& e) {
        MEDSCRIBE_REPORT_EXCEPTION(e, "export");
        throw;
    }
}

} // namespace core
} // namespace medscribe

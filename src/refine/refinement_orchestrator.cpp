#include "refine/refinement_orchestrator.hpp"
#include "refine/prompt_templates.hpp"
#include "stt/transcript_fragment.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace medscribe {
namespace refine {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

RefinementOrchestrator::RefinementOrchestrator(std::shared_ptr<GenerativeService> service)
    : service_(std::move(service)) {
}

bool RefinementOrchestrator::isServiceAvailable() const {
    return service_ && service_->isAvailable();
}

std::string RefinementOrchestrator::skipReason(const std::string& text, MarkerScope scope) const {
    if (trim(text).empty()) {
        return "empty text";
    }
    if (scope == MarkerScope::ANY_LINE && stt::markers::containsFailureMarker(text)) {
        return "text carries a failure marker";
    }
    if (scope == MarkerScope::WHOLE_TEXT && stt::markers::isFailureMarker(text)) {
        return "text is a failure marker";
    }
    if (!isServiceAvailable()) {
        return "generative service unavailable";
    }
    return "";
}

RefinedText RefinementOrchestrator::improve(const std::string& text) const {
    RefinedText result;
    result.sourceText = text;
    result.text = text;

    std::string reason = skipReason(text, MarkerScope::ANY_LINE);
    if (!reason.empty()) {
        utils::Logger::info("Improve skipped: " + reason);
        return result;
    }

    try {
        std::string improved = trim(service_->generate(prompts::buildImprovePrompt(text)));
        if (improved.empty()) {
            utils::Logger::warn("Improve returned no text, keeping the original transcript");
            return result;
        }
        result.text = improved;
        result.refined = true;
        utils::Logger::info("Transcript improved: " + std::to_string(text.size()) + " -> " +
                            std::to_string(improved.size()) + " characters");
    } catch (const utils::GenerationException& e) {
        MEDSCRIBE_REPORT_EXCEPTION(e, "improve");
        utils::Logger::warn("Improve failed, keeping the original transcript: " + std::string(e.what()));
    }

    return result;
}

Summary RefinementOrchestrator::summarize(const std::string& text, const std::string& instruction) const {
    Summary summary;
    summary.createdAt = std::chrono::system_clock::now();

    std::string customInstruction = trim(instruction);
    summary.customInstruction = !customInstruction.empty();

    // Segment markers inside a longer transcript do not block the summary
    summary.skipReason = skipReason(text, MarkerScope::WHOLE_TEXT);
    if (!summary.skipReason.empty()) {
        utils::Logger::info("Summarize skipped: " + summary.skipReason);
        summary.text = text;
        return summary;
    }

    std::string prompt = summary.customInstruction
        ? prompts::buildCustomSummaryPrompt(customInstruction, text)
        : prompts::buildDefaultSummaryPrompt(text);

    utils::Logger::info(std::string("Generating summary with ") +
                        (summary.customInstruction ? "custom" : "default") + " instruction");

    try {
        summary.text = service_->generate(prompt);
    } catch (const utils::GenerationException& e) {
        MEDSCRIBE_REPORT_EXCEPTION(e, "summarize");
        throw;
    }

    summary.generated = true;
    return summary;
}

} // namespace refine
} // namespace medscribe

#pragma once

#include "refine/generative_service.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace medscribe {
namespace refine {

struct RefinedText {
    std::string sourceText;
    std::string text;
    bool refined = false;
};

struct Summary {
    std::string text;
    bool customInstruction = false;
    bool generated = false;
    // Why the text was passed through; empty when generated
    std::string skipReason;
    std::chrono::system_clock::time_point createdAt;
};

/**
 * Improve and Summarize over a generative-text service.
 *
 * Both operations pass the input through untouched when the service is
 * unavailable. Improve also skips any text with a failure-marker line, so
 * markers are never rewritten; Summarize skips only a text that is itself a
 * failure marker. Neither retries. Improve absorbs service errors; Summarize
 * throws them.
 */
class RefinementOrchestrator {
public:
    explicit RefinementOrchestrator(std::shared_ptr<GenerativeService> service);

    RefinedText improve(const std::string& text) const;

    /**
     * @param instruction caller instruction used verbatim; blank selects the
     *        default eight-section layout
     * @throws utils::GenerationException when the service fails
     */
    Summary summarize(const std::string& text, const std::string& instruction = "") const;

    bool isServiceAvailable() const;

private:
    enum class MarkerScope {
        ANY_LINE,
        WHOLE_TEXT
    };

    // Empty when the operation should call the service
    std::string skipReason(const std::string& text, MarkerScope scope) const;

    std::shared_ptr<GenerativeService> service_;
};

} // namespace refine
} // namespace medscribe

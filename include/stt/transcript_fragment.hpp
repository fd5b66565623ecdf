#pragma once

#include <string>

namespace medscribe {
namespace stt {

/**
 * Outcome of recognizing one segment
 */
enum class FragmentKind {
    OK,
    EMPTY,
    UNRECOGNIZED,
    SERVICE_ERROR,
    TIMEOUT
};

/**
 * Result for exactly one segment. Failures are values, not exceptions: they
 * render as a visible marker in the stitched transcript.
 */
struct TranscriptFragment {
    static constexpr int kWholeIndex = -1;

    int index;
    FragmentKind kind;
    std::string text;
    std::string detail;
    int attempts;
    std::string captureStrategy;

    TranscriptFragment()
        : index(kWholeIndex)
        , kind(FragmentKind::EMPTY)
        , attempts(0) {}

    bool isWhole() const { return index == kWholeIndex; }
    bool isOk() const { return kind == FragmentKind::OK; }

    // Recognized text, or the failure marker for this kind
    std::string render() const;

    static TranscriptFragment ok(int index, const std::string& text);
    static TranscriptFragment empty(int index);
    static TranscriptFragment unrecognized(int index);
    static TranscriptFragment serviceError(int index, const std::string& detail);
    static TranscriptFragment timeout(int index);
};

std::string fragmentKindToString(FragmentKind kind);

namespace markers {

extern const char* const kEmptyAudio;
extern const char* const kUnrecognized;
extern const char* const kTimeout;
extern const char* const kServiceErrorPrefix;
extern const char* const kSilentSegment;
// Leads the detail of a capture failure
extern const char* const kUnsupportedFormat;

/**
 * True when the text begins with one of the failure-marker prefixes
 * ("[Erro" or "[Áudio").
 */
bool isFailureMarker(const std::string& text);

/**
 * True when any line of the text is a failure marker. Segment headers and the
 * silent-segment marker are not failures.
 */
bool containsFailureMarker(const std::string& text);

} // namespace markers

} // namespace stt
} // namespace medscribe

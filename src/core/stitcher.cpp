#include "core/stitcher.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace medscribe {
namespace core {

std::string Stitcher::segmentHeader(int index) {
    return "[Segmento " + std::to_string(index + 1) + "]";
}

std::string Stitcher::renderSegmentBody(const stt::TranscriptFragment& fragment) {
    if (fragment.kind == stt::FragmentKind::EMPTY) {
        return stt::markers::kSilentSegment;
    }
    return fragment.render();
}

std::string Stitcher::stitch(std::vector<stt::TranscriptFragment> fragments) {
    if (fragments.empty()) {
        throw utils::PipelineException("No transcript fragments to stitch", "stitch");
    }

    if (fragments.size() == 1) {
        return fragments.front().render();
    }

    std::stable_sort(fragments.begin(), fragments.end(),
                     [](const stt::TranscriptFragment& a, const stt::TranscriptFragment& b) {
                         return a.index < b.index;
                     });

    std::string text;
    size_t failed = 0;
    for (size_t i = 0; i < fragments.size(); ++i) {
        const auto& fragment = fragments[i];
        if (fragment.isWhole()) {
            throw utils::PipelineException("Whole-recording fragment mixed with segment fragments", "stitch");
        }
        if (i > 0 && fragments[i - 1].index == fragment.index) {
            throw utils::PipelineException("Duplicate fragment for segment " +
                                           std::to_string(fragment.index + 1), "stitch");
        }
        if (fragment.kind != stt::FragmentKind::OK && fragment.kind != stt::FragmentKind::EMPTY) {
            ++failed;
        }

        if (!text.empty()) {
            text += "\n\n";
        }
        text += segmentHeader(fragment.index) + "\n" + renderSegmentBody(fragment);
    }

    if (failed > 0) {
        utils::Logger::warn("Stitched transcript contains " + std::to_string(failed) + " of " +
                            std::to_string(fragments.size()) + " failed segments");
    }
    return text;
}

} // namespace core
} // namespace medscribe

#pragma once

#include "stt/transcript_fragment.hpp"
#include <string>
#include <vector>

namespace medscribe {
namespace core {

/**
 * Reassembles per-segment fragments into one transcript text.
 *
 * A single fragment is returned verbatim (text or failure marker). Several
 * fragments are rendered as "[Segmento N]" blocks separated by blank lines,
 * in ascending index order regardless of the order they arrive in.
 */
class Stitcher {
public:
    /**
     * @throws utils::PipelineException when there are no fragments or two
     *         fragments share an index
     */
    static std::string stitch(std::vector<stt::TranscriptFragment> fragments);

    // Body of one segment block: text, silent marker, or failure marker
    static std::string renderSegmentBody(const stt::TranscriptFragment& fragment);

    static std::string segmentHeader(int index);
};

} // namespace core
} // namespace medscribe

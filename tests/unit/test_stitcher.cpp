#include <gtest/gtest.h>
#include "core/stitcher.hpp"
#include "utils/error_handler.hpp"

using namespace medscribe;
using medscribe::core::Stitcher;
using medscribe::stt::TranscriptFragment;

TEST(StitcherTest, SingleFragmentIsVerbatim) {
    std::vector<TranscriptFragment> fragments = {TranscriptFragment::ok(TranscriptFragment::kWholeIndex,
                                                                        "dor de cabeça há dois dias")};
    EXPECT_EQ(Stitcher::stitch(fragments), "dor de cabeça há dois dias");
}

TEST(StitcherTest, SingleFailureIsItsMarker) {
    EXPECT_EQ(Stitcher::stitch({TranscriptFragment::empty(TranscriptFragment::kWholeIndex)}),
              stt::markers::kEmptyAudio);
    EXPECT_EQ(Stitcher::stitch({TranscriptFragment::timeout(TranscriptFragment::kWholeIndex)}),
              stt::markers::kTimeout);
}

TEST(StitcherTest, SegmentsAreLabelledAndOrdered) {
    std::vector<TranscriptFragment> fragments = {
        TranscriptFragment::ok(2, "terceira parte"),
        TranscriptFragment::ok(0, "primeira parte"),
        TranscriptFragment::ok(1, "segunda parte"),
    };

    EXPECT_EQ(Stitcher::stitch(fragments),
              "[Segmento 1]\nprimeira parte\n\n"
              "[Segmento 2]\nsegunda parte\n\n"
              "[Segmento 3]\nterceira parte");
}

TEST(StitcherTest, EmptySegmentIsSilent) {
    std::vector<TranscriptFragment> fragments = {
        TranscriptFragment::ok(0, "olá"),
        TranscriptFragment::empty(1),
    };
    EXPECT_EQ(Stitcher::stitch(fragments), "[Segmento 1]\nolá\n\n[Segmento 2]\n[Segmento silencioso]");
}

TEST(StitcherTest, FailedSegmentsKeepTheirMarkers) {
    std::vector<TranscriptFragment> fragments = {
        TranscriptFragment::ok(0, "início"),
        TranscriptFragment::serviceError(1, "HTTP 500"),
        TranscriptFragment::unrecognized(2),
    };

    std::string text = Stitcher::stitch(fragments);
    EXPECT_NE(text.find("[Segmento 2]\n[Erro no serviço de reconhecimento: HTTP 500]"), std::string::npos);
    EXPECT_NE(text.find(std::string("[Segmento 3]\n") + stt::markers::kUnrecognized), std::string::npos);
    EXPECT_TRUE(stt::markers::containsFailureMarker(text));
}

TEST(StitcherTest, InvalidInputThrows) {
    EXPECT_THROW(Stitcher::stitch({}), utils::PipelineException);
    EXPECT_THROW(Stitcher::stitch({TranscriptFragment::ok(0, "a"), TranscriptFragment::ok(0, "b")}),
                 utils::PipelineException);
    EXPECT_THROW(Stitcher::stitch({TranscriptFragment::ok(TranscriptFragment::kWholeIndex, "a"),
                                   TranscriptFragment::ok(0, "b")}),
                 utils::PipelineException);
}

TEST(StitcherTest, SegmentHeaderIsOneBased) {
    EXPECT_EQ(Stitcher::segmentHeader(0), "[Segmento 1]");
    EXPECT_EQ(Stitcher::segmentHeader(9), "[Segmento 10]");
}

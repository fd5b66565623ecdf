#include <gtest/gtest.h>
#include "stt/transcript_fragment.hpp"

using namespace medscribe::stt;

TEST(TranscriptFragmentTest, OkRendersText) {
    auto fragment = TranscriptFragment::ok(2, "paciente relata dor abdominal");
    EXPECT_TRUE(fragment.isOk());
    EXPECT_FALSE(fragment.isWhole());
    EXPECT_EQ(fragment.render(), "paciente relata dor abdominal");
}

TEST(TranscriptFragmentTest, DefaultIsWholeRecording) {
    TranscriptFragment fragment;
    EXPECT_TRUE(fragment.isWhole());
    EXPECT_EQ(fragment.kind, FragmentKind::EMPTY);
}

TEST(TranscriptFragmentTest, FailureKindsRenderMarkers) {
    EXPECT_EQ(TranscriptFragment::empty(0).render(), markers::kEmptyAudio);
    EXPECT_EQ(TranscriptFragment::unrecognized(0).render(), markers::kUnrecognized);
    EXPECT_EQ(TranscriptFragment::timeout(0).render(), markers::kTimeout);
    EXPECT_EQ(TranscriptFragment::serviceError(0, "HTTP 403").render(),
              "[Erro no serviço de reconhecimento: HTTP 403]");
}

TEST(TranscriptFragmentTest, EveryFailureMarkerIsDetected) {
    EXPECT_TRUE(markers::isFailureMarker(TranscriptFragment::empty(0).render()));
    EXPECT_TRUE(markers::isFailureMarker(TranscriptFragment::unrecognized(0).render()));
    EXPECT_TRUE(markers::isFailureMarker(TranscriptFragment::timeout(0).render()));
    EXPECT_TRUE(markers::isFailureMarker(TranscriptFragment::serviceError(0, "x").render()));
    EXPECT_TRUE(markers::isFailureMarker("  [Erro genérico]"));
}

TEST(TranscriptFragmentTest, OrdinaryTextIsNotAFailure) {
    EXPECT_FALSE(markers::isFailureMarker("Erro de digitação na receita"));
    EXPECT_FALSE(markers::isFailureMarker(markers::kSilentSegment));
    EXPECT_FALSE(markers::isFailureMarker(""));
}

TEST(TranscriptFragmentTest, ContainsFailureMarkerChecksEachLine) {
    std::string stitched = "[Segmento 1]\nbom dia doutor\n\n[Segmento 2]\n" +
                           std::string(markers::kTimeout);
    EXPECT_TRUE(markers::containsFailureMarker(stitched));

    std::string clean = "[Segmento 1]\nbom dia doutor\n\n[Segmento 2]\n" +
                        std::string(markers::kSilentSegment);
    EXPECT_FALSE(markers::containsFailureMarker(clean));
}

TEST(TranscriptFragmentTest, KindNames) {
    EXPECT_EQ(fragmentKindToString(FragmentKind::OK), "OK");
    EXPECT_EQ(fragmentKindToString(FragmentKind::SERVICE_ERROR), "SERVICE_ERROR");
    EXPECT_EQ(fragmentKindToString(FragmentKind::TIMEOUT), "TIMEOUT");
}

#include <gtest/gtest.h>
#include "core/artifact_naming.hpp"
#include <ctime>

using medscribe::core::ArtifactKind;
using medscribe::core::ArtifactNaming;

namespace {

std::chrono::system_clock::time_point localTime(int year, int month, int day,
                                                int hour, int minute, int second) {
    std::tm local{};
    local.tm_year = year - 1900;
    local.tm_mon = month - 1;
    local.tm_mday = day;
    local.tm_hour = hour;
    local.tm_min = minute;
    local.tm_sec = second;
    local.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

} // namespace

class ArtifactNamingTest : public ::testing::Test {
protected:
    std::chrono::system_clock::time_point created_ = localTime(2026, 10, 18, 9, 30, 15);
};

TEST_F(ArtifactNamingTest, BaseNameWithSubject) {
    EXPECT_EQ(ArtifactNaming::baseName("dr_lima", "João Silva", created_),
              "dr_lima_João_Silva_20261018_093015");
}

TEST_F(ArtifactNamingTest, BaseNameDefaultsSubject) {
    EXPECT_EQ(ArtifactNaming::baseName("dr_lima", "", created_), "dr_lima_conversa_20261018_093015");
    EXPECT_EQ(ArtifactNaming::baseName("dr_lima", " ?! ", created_), "dr_lima_conversa_20261018_093015");
}

TEST_F(ArtifactNamingTest, SanitizeSubject) {
    EXPECT_EQ(ArtifactNaming::sanitizeSubject("  Maria  de/Souza: retorno "), "Maria_deSouza_retorno");
    EXPECT_EQ(ArtifactNaming::sanitizeSubject("caso-01_b"), "caso-01_b");
    EXPECT_EQ(ArtifactNaming::sanitizeSubject("../../etc"), "etc");
}

TEST_F(ArtifactNamingTest, Suffixes) {
    const std::string base = "dr_lima_conversa_20261018_093015";
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::RECORDING), base + ".wav");
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::TRANSCRIPT), base + "_transcricao.txt");
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::SUMMARY), base + "_resumo.txt");
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::CONVERSATION), base + "_conversa_completa.txt");
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::PDF_EXPORT), base + "_resumo.pdf");
    EXPECT_EQ(ArtifactNaming::artifactName(base, ArtifactKind::DOCX_EXPORT), base + "_resumo.docx");
}

TEST_F(ArtifactNamingTest, DerivedNamesMapBackToBase) {
    const std::string base = "dr_lima_Ana_20261018_093015";
    for (auto kind : {ArtifactKind::RECORDING, ArtifactKind::TRANSCRIPT, ArtifactKind::SUMMARY,
                      ArtifactKind::CONVERSATION, ArtifactKind::PDF_EXPORT, ArtifactKind::DOCX_EXPORT}) {
        EXPECT_EQ(ArtifactNaming::baseFromArtifact(ArtifactNaming::artifactName(base, kind)), base);
    }
    EXPECT_EQ(ArtifactNaming::baseFromArtifact("/data/out/" + base + "_resumo.txt"), base);
    EXPECT_EQ(ArtifactNaming::baseFromArtifact(base + ".mp3"), base);
    EXPECT_EQ(ArtifactNaming::baseFromArtifact(base), base);
}

TEST_F(ArtifactNamingTest, Ownership) {
    EXPECT_TRUE(ArtifactNaming::isOwnedBy("ana_conversa_20261018_093015.wav", "ana"));
    EXPECT_TRUE(ArtifactNaming::isOwnedBy("/tmp/ana_conversa_20261018_093015.wav", "ana"));
    EXPECT_FALSE(ArtifactNaming::isOwnedBy("anabela_conversa_20261018_093015.wav", "ana"));
    EXPECT_FALSE(ArtifactNaming::isOwnedBy("bruno_conversa_20261018_093015.wav", "ana"));
    EXPECT_FALSE(ArtifactNaming::isOwnedBy("ana_conversa_20261018_093015.wav", ""));
}

TEST_F(ArtifactNamingTest, SubjectFromBase) {
    EXPECT_EQ(ArtifactNaming::subjectFromBase("ana_Maria_Souza_20261018_093015", "ana"), "Maria_Souza");
    EXPECT_EQ(ArtifactNaming::subjectFromBase("ana_conversa_20261018_093015", "ana"), "");
    EXPECT_EQ(ArtifactNaming::subjectFromBase("bruno_Maria_20261018_093015", "ana"), "");
}

TEST_F(ArtifactNamingTest, ExportTitle) {
    EXPECT_EQ(ArtifactNaming::exportTitle("Maria_Souza"), "Resumo da Consulta - Maria Souza");
    EXPECT_EQ(ArtifactNaming::exportTitle(""), "Resumo da Consulta - Conversa");
    EXPECT_EQ(ArtifactNaming::exportTitle("", "Relatório"), "Relatório - Conversa");
}

TEST_F(ArtifactNamingTest, ConversationRecordHoldsBothTexts) {
    std::string record = ArtifactNaming::buildConversationRecord("texto transcrito", "## RESUMO", created_);

    EXPECT_EQ(record.rfind("# CONVERSA COMPLETA - 18/10/2026 às 09:30", 0), 0u);
    size_t transcript = record.find("texto transcrito");
    size_t summary = record.find("## RESUMO");
    ASSERT_NE(transcript, std::string::npos);
    ASSERT_NE(summary, std::string::npos);
    EXPECT_LT(transcript, summary);
    EXPECT_NE(record.find(std::string(80, '=')), std::string::npos);
}

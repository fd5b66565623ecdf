#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "refine/refinement_orchestrator.hpp"
#include "refine/prompt_templates.hpp"
#include "mocks/mock_services.hpp"
#include "stt/transcript_fragment.hpp"
#include "utils/error_handler.hpp"

using namespace medscribe;
using namespace medscribe::refine;
using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class RefinementOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_shared<NiceMock<mocks::MockGenerativeService>>();
        ON_CALL(*service_, isAvailable()).WillByDefault(Return(true));
        ON_CALL(*service_, getName()).WillByDefault(Return("mock-gen"));
        orchestrator_ = std::make_unique<RefinementOrchestrator>(service_);
        utils::ErrorHandler::getInstance().clearErrorHistory();
    }

    std::shared_ptr<NiceMock<mocks::MockGenerativeService>> service_;
    std::unique_ptr<RefinementOrchestrator> orchestrator_;
};

TEST_F(RefinementOrchestratorTest, ImproveReplacesText) {
    EXPECT_CALL(*service_, generate(HasSubstr("paciente relata tosse")))
        .WillOnce(Return("  Paciente relata tosse.\n"));

    RefinedText result = orchestrator_->improve("paciente relata tosse");
    EXPECT_TRUE(result.refined);
    EXPECT_EQ(result.text, "Paciente relata tosse.");
    EXPECT_EQ(result.sourceText, "paciente relata tosse");
}

TEST_F(RefinementOrchestratorTest, ImproveSkipsFailureMarkers) {
    EXPECT_CALL(*service_, generate(_)).Times(0);

    std::string text = std::string("[Segmento 1]\nbom dia\n\n[Segmento 2]\n") + stt::markers::kTimeout;
    RefinedText result = orchestrator_->improve(text);
    EXPECT_FALSE(result.refined);
    EXPECT_EQ(result.text, text);
}

TEST_F(RefinementOrchestratorTest, ImproveSkipsBlankText) {
    EXPECT_CALL(*service_, generate(_)).Times(0);
    EXPECT_FALSE(orchestrator_->improve(" \n").refined);
}

TEST_F(RefinementOrchestratorTest, ImproveSkipsUnavailableService) {
    ON_CALL(*service_, isAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*service_, generate(_)).Times(0);

    EXPECT_FALSE(orchestrator_->isServiceAvailable());
    EXPECT_EQ(orchestrator_->improve("texto").text, "texto");
}

TEST_F(RefinementOrchestratorTest, ImproveAbsorbsServiceErrors) {
    EXPECT_CALL(*service_, generate(_))
        .WillOnce(Throw(utils::GenerationException("Generative service rejected the request", "HTTP 500")));

    RefinedText result = orchestrator_->improve("texto original");
    EXPECT_FALSE(result.refined);
    EXPECT_EQ(result.text, "texto original");
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorCategory::GENERATION), 1u);
}

TEST_F(RefinementOrchestratorTest, ImproveKeepsOriginalOnBlankReply) {
    EXPECT_CALL(*service_, generate(_)).WillOnce(Return("   "));
    RefinedText result = orchestrator_->improve("texto original");
    EXPECT_FALSE(result.refined);
    EXPECT_EQ(result.text, "texto original");
}

TEST_F(RefinementOrchestratorTest, NullServiceIsUnavailable) {
    RefinementOrchestrator orchestrator(nullptr);
    EXPECT_FALSE(orchestrator.isServiceAvailable());
    EXPECT_FALSE(orchestrator.improve("texto").refined);
    EXPECT_FALSE(orchestrator.summarize("texto").generated);
}

TEST_F(RefinementOrchestratorTest, DefaultSummaryUsesSectionLayout) {
    EXPECT_CALL(*service_, generate(AllOf(HasSubstr("### 🔍 QUEIXA PRINCIPAL"), HasSubstr("febre alta"))))
        .WillOnce(Return("## RESUMO DA CONSULTA"));

    Summary summary = orchestrator_->summarize("febre alta");
    EXPECT_TRUE(summary.generated);
    EXPECT_FALSE(summary.customInstruction);
    EXPECT_EQ(summary.text, "## RESUMO DA CONSULTA");
}

TEST_F(RefinementOrchestratorTest, CustomInstructionIsVerbatim) {
    EXPECT_CALL(*service_, generate(HasSubstr("INSTRUÇÕES DO USUÁRIO:\nListe apenas as medicações")))
        .WillOnce(Return("- dipirona"));

    Summary summary = orchestrator_->summarize("tomar dipirona", "  Liste apenas as medicações ");
    EXPECT_TRUE(summary.generated);
    EXPECT_TRUE(summary.customInstruction);
    EXPECT_EQ(summary.text, "- dipirona");
}

TEST_F(RefinementOrchestratorTest, SummarySkipReturnsInput) {
    EXPECT_CALL(*service_, generate(_)).Times(0);

    Summary summary = orchestrator_->summarize(stt::markers::kEmptyAudio);
    EXPECT_FALSE(summary.generated);
    EXPECT_EQ(summary.text, stt::markers::kEmptyAudio);
    EXPECT_EQ(summary.skipReason, "text is a failure marker");
}

TEST_F(RefinementOrchestratorTest, PartiallyFailedTranscriptIsSummarized) {
    const std::string transcript = std::string("[Segmento 1]\npaciente com dor lombar\n\n") +
                                   "[Segmento 2]\n" + stt::markers::kTimeout + "\n\n" +
                                   "[Segmento 3]\nretorno em duas semanas";

    EXPECT_CALL(*service_, generate(AllOf(HasSubstr("paciente com dor lombar"),
                                          HasSubstr("retorno em duas semanas"))))
        .WillOnce(Return("## RESUMO DA CONSULTA"));

    Summary summary = orchestrator_->summarize(transcript);
    EXPECT_TRUE(summary.generated);
    EXPECT_TRUE(summary.skipReason.empty());
    EXPECT_EQ(summary.text, "## RESUMO DA CONSULTA");

    // Improve still leaves marker-bearing text alone
    EXPECT_FALSE(orchestrator_->improve(transcript).refined);
}

TEST_F(RefinementOrchestratorTest, UnavailableServiceSkipReason) {
    ON_CALL(*service_, isAvailable()).WillByDefault(Return(false));
    EXPECT_CALL(*service_, generate(_)).Times(0);

    Summary summary = orchestrator_->summarize("texto");
    EXPECT_FALSE(summary.generated);
    EXPECT_EQ(summary.skipReason, "generative service unavailable");
}

TEST_F(RefinementOrchestratorTest, SummaryPropagatesServiceErrors) {
    EXPECT_CALL(*service_, generate(_))
        .WillOnce(Throw(utils::GenerationException("Generative service timed out")));

    EXPECT_THROW(orchestrator_->summarize("texto"), utils::GenerationException);
    EXPECT_EQ(utils::ErrorHandler::getInstance().getErrorCount(utils::ErrorCategory::GENERATION), 1u);
}

TEST(PromptTemplatesTest, ImprovePromptEmbedsTranscript) {
    std::string prompt = prompts::buildImprovePrompt("texto da consulta");
    EXPECT_NE(prompt.find("Transcrição original:\ntexto da consulta\n"), std::string::npos);
    EXPECT_NE(prompt.find("Mantenha todos os termos médicos"), std::string::npos);
}

TEST(PromptTemplatesTest, DefaultSummaryHasEverySection) {
    std::string prompt = prompts::buildDefaultSummaryPrompt("x");
    for (const char* section : {"## RESUMO DA CONSULTA", "**Data:**", "**Paciente:**", "QUEIXA PRINCIPAL",
                                "HISTÓRICO", "EXAME FÍSICO", "CONDUTA/TRATAMENTO",
                                "OBSERVAÇÕES IMPORTANTES", "RETORNO"}) {
        EXPECT_NE(prompt.find(section), std::string::npos) << section;
    }
}

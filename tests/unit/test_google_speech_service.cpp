#include <gtest/gtest.h>
#include "stt/google_speech_service.hpp"
#include <nlohmann/json.hpp>

using namespace medscribe;
using namespace medscribe::stt;
using json = nlohmann::json;

namespace {

utils::HttpResult httpReply(long status, const std::string& body) {
    utils::HttpResult result;
    result.transportOk = true;
    result.statusCode = status;
    result.body = body;
    return result;
}

} // namespace

TEST(GoogleSpeechServiceTest, RequestBodyDescribesLinear16) {
    json body = json::parse(GoogleSpeechService::buildRequestBody({0x0102, -1}, 16000, "pt-BR"));

    EXPECT_EQ(body["config"]["encoding"], "LINEAR16");
    EXPECT_EQ(body["config"]["sampleRateHertz"], 16000);
    EXPECT_EQ(body["config"]["languageCode"], "pt-BR");
    // Little-endian bytes 02 01 FF FF
    EXPECT_EQ(body["audio"]["content"], "AgH//w==");
}

TEST(GoogleSpeechServiceTest, ResultsAreJoined) {
    auto response = GoogleSpeechService::interpretResponse(httpReply(200, R"({
        "results": [
            {"alternatives": [{"transcript": "paciente com febre", "confidence": 0.81}]},
            {"alternatives": [{"transcript": "há três dias", "confidence": 0.9}]}
        ]})"));

    EXPECT_EQ(response.status, RecognitionStatus::OK);
    EXPECT_EQ(response.text, "paciente com febre há três dias");
    EXPECT_NEAR(response.confidence, 0.9f, 1e-6f);
}

TEST(GoogleSpeechServiceTest, NoResultsIsNotUnderstood) {
    EXPECT_EQ(GoogleSpeechService::interpretResponse(httpReply(200, "{}")).status,
              RecognitionStatus::NOT_UNDERSTOOD);
    EXPECT_EQ(GoogleSpeechService::interpretResponse(
                  httpReply(200, R"({"results": [{"alternatives": [{"transcript": ""}]}]})")).status,
              RecognitionStatus::NOT_UNDERSTOOD);
}

TEST(GoogleSpeechServiceTest, HttpErrorCarriesServiceMessage) {
    auto response = GoogleSpeechService::interpretResponse(
        httpReply(400, R"({"error": {"code": 400, "message": "Invalid sample rate"}})"));

    EXPECT_EQ(response.status, RecognitionStatus::REQUEST_ERROR);
    EXPECT_EQ(response.detail, "HTTP 400: Invalid sample rate");
}

TEST(GoogleSpeechServiceTest, MalformedBodyIsRequestError) {
    auto response = GoogleSpeechService::interpretResponse(httpReply(200, "<html>"));
    EXPECT_EQ(response.status, RecognitionStatus::REQUEST_ERROR);
    EXPECT_NE(response.detail.find("malformed response"), std::string::npos);
}

TEST(GoogleSpeechServiceTest, UnexpectedFieldTypesAreRequestErrors) {
    const std::vector<std::string> bodies = {
        R"({"results": [{"alternatives": [{"transcript": 42}]}]})",
        R"({"results": [{"alternatives": [{"transcript": "ok", "confidence": "alta"}]}]})",
        R"({"results": [{"alternatives": "nenhuma"}]})",
    };
    for (const auto& body : bodies) {
        RecognitionResponse response;
        EXPECT_NO_THROW(response = GoogleSpeechService::interpretResponse(httpReply(200, body))) << body;
        EXPECT_EQ(response.status, RecognitionStatus::REQUEST_ERROR) << body;
        EXPECT_NE(response.detail.find("unexpected response structure"), std::string::npos) << body;
    }

    auto rejected = GoogleSpeechService::interpretResponse(httpReply(400, R"({"error": {"message": 7}})"));
    EXPECT_EQ(rejected.status, RecognitionStatus::REQUEST_ERROR);
}

TEST(GoogleSpeechServiceTest, TransportFailures) {
    utils::HttpResult timedOut;
    timedOut.timedOut = true;
    timedOut.error = "Operation timed out";
    EXPECT_EQ(GoogleSpeechService::interpretResponse(timedOut).status, RecognitionStatus::TIMEOUT);

    utils::HttpResult refused;
    refused.error = "Couldn't connect to server";
    auto response = GoogleSpeechService::interpretResponse(refused);
    EXPECT_EQ(response.status, RecognitionStatus::REQUEST_ERROR);
    EXPECT_NE(response.detail.find("Couldn't connect"), std::string::npos);
}

TEST(GoogleSpeechServiceTest, MissingKeyFailsWithoutNetwork) {
    utils::RecognitionConfig config;
    config.apiKey.clear();
    GoogleSpeechService service(config);

    auto response = service.recognize({1, 2, 3}, 16000, "pt-BR", std::chrono::milliseconds(100));
    EXPECT_EQ(response.status, RecognitionStatus::REQUEST_ERROR);
    EXPECT_EQ(service.getName(), "google-speech");
}

TEST(GoogleSpeechServiceTest, StatusNames) {
    EXPECT_EQ(recognitionStatusToString(RecognitionStatus::NOT_UNDERSTOOD), "NOT_UNDERSTOOD");
    EXPECT_EQ(recognitionStatusToString(RecognitionStatus::TIMEOUT), "TIMEOUT");
}

TEST(GoogleSpeechServiceTest, Base64Padding) {
    EXPECT_EQ(utils::base64Encode({}), "");
    EXPECT_EQ(utils::base64Encode({'M'}), "TQ==");
    EXPECT_EQ(utils::base64Encode({'M', 'a'}), "TWE=");
    EXPECT_EQ(utils::base64Encode({'M', 'a', 'n'}), "TWFu");
}

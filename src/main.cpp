#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include "core/artifact_naming.hpp"
#include "core/transcription_pipeline.hpp"
#include "render/document_renderer.hpp"
#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

using namespace medscribe;

namespace {

struct CommandLine {
    std::string command;
    std::string input;
    std::string configPath = "config/medscribe.json";
    std::string ownerId;
    std::string subject;
    std::string instruction;
    std::string format = "pdf";
    std::string outputDir = ".";
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <command> <input> [options]\n"
              << "Commands:\n"
              << "  record <audio>           Normalize audio and store it as canonical WAV\n"
              << "  transcribe <audio>       Transcribe audio into <base>_transcricao.txt\n"
              << "  improve <transcript>     Correct a transcript in place\n"
              << "  summarize <transcript>   Write <base>_resumo.txt and <base>_conversa_completa.txt\n"
              << "  export <summary>         Render a summary as PDF or DOCX\n"
              << "Options:\n"
              << "  --config <path>          Configuration file (default: config/medscribe.json)\n"
              << "  --owner <id>             Owner id (required)\n"
              << "  --subject <label>        Subject label for new recordings\n"
              << "  --instruction <text>     Custom summary instruction\n"
              << "  --format <pdf|docx>      Export format (default: pdf)\n"
              << "  --output-dir <dir>       Where artifacts are written (default: .)\n"
              << "  --help, -h               Show this help message\n";
}

std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw utils::PipelineException("Cannot open " + path, "io");
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::string readText(const std::string& path) {
    std::vector<uint8_t> bytes = readBytes(path);
    return std::string(bytes.begin(), bytes.end());
}

void writeBytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw utils::PipelineException("Cannot write " + path.string(), "io");
    }
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file) {
        throw utils::PipelineException("Short write to " + path.string(), "io");
    }
}

void writeText(const std::filesystem::path& path, const std::string& text) {
    writeBytes(path, std::vector<uint8_t>(text.begin(), text.end()));
}

audio::RecordingMetadata newRecording(const CommandLine& cli) {
    audio::RecordingMetadata metadata;
    metadata.ownerId = cli.ownerId;
    metadata.subject = cli.subject;
    metadata.createdAt = std::chrono::system_clock::now();
    metadata.id = core::ArtifactNaming::baseName(cli.ownerId, cli.subject, metadata.createdAt);
    return metadata;
}

std::filesystem::path outputPath(const CommandLine& cli, const std::string& base, core::ArtifactKind kind) {
    return std::filesystem::path(cli.outputDir) / core::ArtifactNaming::artifactName(base, kind);
}

int runRecord(core::TranscriptionPipeline& pipeline, const CommandLine& cli) {
    audio::RecordingMetadata metadata = newRecording(cli);
    audio::RecordingPtr recording = pipeline.record(readBytes(cli.input), metadata);

    auto path = outputPath(cli, metadata.id, core::ArtifactKind::RECORDING);
    writeBytes(path, recording->toWav());
    std::cout << path.string() << std::endl;
    return 0;
}

int runTranscribe(core::TranscriptionPipeline& pipeline, const CommandLine& cli) {
    audio::RecordingMetadata metadata = newRecording(cli);
    core::Transcript transcript = pipeline.transcribe(readBytes(cli.input), metadata);

    auto path = outputPath(cli, metadata.id, core::ArtifactKind::TRANSCRIPT);
    writeText(path, transcript.text);
    std::cout << path.string() << std::endl;
    return transcript.hasFailures() ? 2 : 0;
}

int runImprove(core::TranscriptionPipeline& pipeline, const CommandLine& cli) {
    pipeline.checkOwnership(cli.input, cli.ownerId);
    refine::RefinedText refined = pipeline.improve(readText(cli.input));
    if (refined.refined) {
        writeText(cli.input, refined.text);
    }
    std::cout << cli.input << (refined.refined ? "" : " (unchanged)") << std::endl;
    return 0;
}

int runSummarize(core::TranscriptionPipeline& pipeline, const CommandLine& cli) {
    std::string transcript = readText(cli.input);
    refine::Summary summary = pipeline.summarizeArtifact(cli.input, cli.ownerId, transcript, cli.instruction);

    std::string base = core::ArtifactNaming::baseFromArtifact(cli.input);
    auto summaryPath = outputPath(cli, base, core::ArtifactKind::SUMMARY);
    writeText(summaryPath, summary.text);

    auto conversationPath = outputPath(cli, base, core::ArtifactKind::CONVERSATION);
    writeText(conversationPath,
              core::ArtifactNaming::buildConversationRecord(transcript, summary.text, summary.createdAt));

    std::cout << summaryPath.string() << "\n" << conversationPath.string() << std::endl;
    return 0;
}

int runExport(core::TranscriptionPipeline& pipeline, const CommandLine& cli) {
    render::DocumentEncoding encoding = render::DocumentRenderer::parseEncoding(cli.format);
    render::ExportedDocument document =
        pipeline.exportSummary(cli.input, cli.ownerId, readText(cli.input), encoding);

    std::string base = core::ArtifactNaming::baseFromArtifact(cli.input);
    auto kind = encoding == render::DocumentEncoding::PDF ? core::ArtifactKind::PDF_EXPORT
                                                          : core::ArtifactKind::DOCX_EXPORT;
    auto path = outputPath(cli, base, kind);
    writeBytes(path, document.bytes);
    std::cout << path.string() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine cli;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (arg == "--owner" && i + 1 < argc) {
            cli.ownerId = argv[++i];
        } else if (arg == "--subject" && i + 1 < argc) {
            cli.subject = argv[++i];
        } else if (arg == "--instruction" && i + 1 < argc) {
            cli.instruction = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            cli.format = argv[++i];
        } else if (arg == "--output-dir" && i + 1 < argc) {
            cli.outputDir = argv[++i];
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else if (cli.input.empty()) {
            cli.input = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (cli.command.empty() || cli.input.empty() || cli.ownerId.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        utils::Logger::initialize();

        utils::PipelineConfig config = utils::ConfigManager::load(cli.configPath);
        utils::Logger::setLevel(utils::Logger::parseLevel(config.logging.level));

        auto pipeline = core::TranscriptionPipeline::create(config);

        if (cli.command == "record") {
            return runRecord(*pipeline, cli);
        } else if (cli.command == "transcribe") {
            return runTranscribe(*pipeline, cli);
        } else if (cli.command == "improve") {
            return runImprove(*pipeline, cli);
        } else if (cli.command == "summarize") {
            return runSummarize(*pipeline, cli);
        } else if (cli.command == "export") {
            return runExport(*pipeline, cli);
        }

        std::cerr << "Unknown command: " << cli.command << std::endl;
        printUsage(argv[0]);
        return 1;

    } catch (const utils::MedScribeException& e) {
        MEDSCRIBE_REPORT_EXCEPTION(e, cli.command);
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

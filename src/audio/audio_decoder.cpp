#include "audio/audio_decoder.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include "utils/scoped_temp_file.hpp"
#include <array>
#include <cstdio>

namespace medscribe {
namespace audio {

namespace {

std::string shellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace

DecodedAudio WavDecoder::decode(const std::vector<uint8_t>& bytes) const {
    WavInfo info = WavContainer::parse(bytes);

    DecodedAudio decoded;
    decoded.sampleRate = info.sampleRate;
    decoded.channels = info.channels;
    decoded.samples = AudioFormatConverter::convertToFloat(bytes.data() + info.dataOffset,
                                                           info.dataSize, info.codec);

    if (decoded.samples.empty()) {
        throw utils::AudioProcessingException("WAV data chunk holds no samples", "WavDecoder");
    }

    utils::Logger::debug("Decoded WAV: " + info.toString());
    return decoded;
}

FfmpegDecoder::FfmpegDecoder(std::string binary, uint32_t targetSampleRate)
    : binary_(std::move(binary)), targetSampleRate_(targetSampleRate) {
}

std::string FfmpegDecoder::buildCommand(const std::string& inputPath) const {
    return shellQuote(binary_) + " -hide_banner -loglevel error -nostdin -i " +
           shellQuote(inputPath) + " -ac 1 -ar " + std::to_string(targetSampleRate_) +
           " -acodec pcm_s16le -f wav - 2>/dev/null";
}

DecodedAudio FfmpegDecoder::decode(const std::vector<uint8_t>& bytes) const {
    utils::ScopedTempFile input(".bin");
    input.write(bytes);

    std::string cmd = buildCommand(input.path());
    utils::Logger::debug("Running external decoder: " + cmd);

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        throw utils::AudioProcessingException("Failed to execute " + binary_, "FfmpegDecoder");
    }

    std::vector<uint8_t> buffer;
    std::array<uint8_t, 4096> chunk;
    size_t bytesRead;

    while ((bytesRead = fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
        buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + bytesRead);
    }

    int returnCode = pclose(pipe);

    if (returnCode != 0 || buffer.empty()) {
        throw utils::AudioProcessingException(
            binary_ + " could not decode the input (exit status " + std::to_string(returnCode) + ")",
            "FfmpegDecoder");
    }

    return WavDecoder().decode(buffer);
}

} // namespace audio
} // namespace medscribe

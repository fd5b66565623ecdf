#include "stt/transcript_fragment.hpp"
#include <sstream>

namespace medscribe {
namespace stt {

namespace markers {

const char* const kEmptyAudio = "[Áudio vazio ou muito baixo]";
const char* const kUnrecognized =
    "[Áudio não pôde ser compreendido - verifique a qualidade do áudio e tente falar mais claramente]";
const char* const kTimeout =
    "[Erro: Timeout na transcrição. O arquivo pode ser muito longo ou a conexão está lenta. "
    "Tente dividir o áudio em partes menores.]";
const char* const kServiceErrorPrefix = "[Erro no serviço de reconhecimento: ";
const char* const kSilentSegment = "[Segmento silencioso]";
const char* const kUnsupportedFormat =
    "Não foi possível processar o arquivo de áudio. O formato pode não ser suportado. Detalhes: ";

namespace {

const char* const kFailurePrefixes[] = {"[Erro", "[Áudio"};

std::string trimLeft(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    return start == std::string::npos ? std::string() : text.substr(start);
}

} // namespace

bool isFailureMarker(const std::string& text) {
    std::string trimmed = trimLeft(text);
    for (const char* prefix : kFailurePrefixes) {
        if (trimmed.compare(0, std::char_traits<char>::length(prefix), prefix) == 0) {
            return true;
        }
    }
    return false;
}

bool containsFailureMarker(const std::string& text) {
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (isFailureMarker(line)) {
            return true;
        }
    }
    return false;
}

} // namespace markers

std::string TranscriptFragment::render() const {
    switch (kind) {
        case FragmentKind::OK:
            return text;
        case FragmentKind::EMPTY:
            return markers::kEmptyAudio;
        case FragmentKind::UNRECOGNIZED:
            return markers::kUnrecognized;
        case FragmentKind::SERVICE_ERROR:
            return std::string(markers::kServiceErrorPrefix) + detail + "]";
        case FragmentKind::TIMEOUT:
            return markers::kTimeout;
    }
    return text;
}

TranscriptFragment TranscriptFragment::ok(int index, const std::string& text) {
    TranscriptFragment fragment;
    fragment.index = index;
    fragment.kind = FragmentKind::OK;
    fragment.text = text;
    return fragment;
}

TranscriptFragment TranscriptFragment::empty(int index) {
    TranscriptFragment fragment;
    fragment.index = index;
    fragment.kind = FragmentKind::EMPTY;
    return fragment;
}

TranscriptFragment TranscriptFragment::unrecognized(int index) {
    TranscriptFragment fragment;
    fragment.index = index;
    fragment.kind = FragmentKind::UNRECOGNIZED;
    return fragment;
}

TranscriptFragment TranscriptFragment::serviceError(int index, const std::string& detail) {
    TranscriptFragment fragment;
    fragment.index = index;
    fragment.kind = FragmentKind::SERVICE_ERROR;
    fragment.detail = detail;
    return fragment;
}

TranscriptFragment TranscriptFragment::timeout(int index) {
    TranscriptFragment fragment;
    fragment.index = index;
    fragment.kind = FragmentKind::TIMEOUT;
    return fragment;
}

std::string fragmentKindToString(FragmentKind kind) {
    switch (kind) {
        case FragmentKind::OK: return "OK";
        case FragmentKind::EMPTY: return "EMPTY";
        case FragmentKind::UNRECOGNIZED: return "UNRECOGNIZED";
        case FragmentKind::SERVICE_ERROR: return "SERVICE_ERROR";
        case FragmentKind::TIMEOUT: return "TIMEOUT";
    }
    return "UNKNOWN";
}

} // namespace stt
} // namespace medscribe

#include "core/artifact_naming.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace medscribe {
namespace core {

namespace {

// "_YYYYmmdd_HHMMSS"
constexpr size_t kTimestampSuffixLength = 16;

const ArtifactKind kAllKinds[] = {
    ArtifactKind::CONVERSATION,
    ArtifactKind::TRANSCRIPT,
    ArtifactKind::PDF_EXPORT,
    ArtifactKind::DOCX_EXPORT,
    ArtifactKind::SUMMARY,
    ArtifactKind::RECORDING
};

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isTimestampSuffix(const std::string& value) {
    if (value.size() != kTimestampSuffixLength || value[0] != '_' || value[9] != '_') {
        return false;
    }
    for (size_t i = 1; i < value.size(); ++i) {
        if (i != 9 && !std::isdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

std::string ArtifactNaming::sanitizeSubject(const std::string& subject) {
    std::string kept;
    kept.reserve(subject.size());
    for (char c : subject) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == ' ' || c == '_' || c == '-' || uc >= 0x80) {
            kept += c;
        }
    }

    size_t start = kept.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = kept.find_last_not_of(' ');
    kept = kept.substr(start, end - start + 1);

    std::string result;
    result.reserve(kept.size());
    for (char c : kept) {
        if (c == ' ') {
            if (result.empty() || result.back() != '_') {
                result += '_';
            }
        } else {
            result += c;
        }
    }
    return result;
}

std::string ArtifactNaming::baseName(const std::string& ownerId,
                                     const std::string& subject,
                                     std::chrono::system_clock::time_point createdAt) {
    std::string safeSubject = sanitizeSubject(subject);
    if (safeSubject.empty()) {
        safeSubject = kDefaultSubject;
    }
    return ownerId + "_" + safeSubject + "_" + formatTimestamp(createdAt, "%Y%m%d_%H%M%S");
}

std::string ArtifactNaming::suffixFor(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::RECORDING: return ".wav";
        case ArtifactKind::TRANSCRIPT: return "_transcricao.txt";
        case ArtifactKind::SUMMARY: return "_resumo.txt";
        case ArtifactKind::CONVERSATION: return "_conversa_completa.txt";
        case ArtifactKind::PDF_EXPORT: return "_resumo.pdf";
        case ArtifactKind::DOCX_EXPORT: return "_resumo.docx";
    }
    return "";
}

std::string ArtifactNaming::artifactName(const std::string& base, ArtifactKind kind) {
    return base + suffixFor(kind);
}

std::string ArtifactNaming::baseFromArtifact(const std::string& name) {
    size_t slash = name.find_last_of('/');
    std::string file = slash == std::string::npos ? name : name.substr(slash + 1);

    for (ArtifactKind kind : kAllKinds) {
        std::string suffix = suffixFor(kind);
        if (endsWith(file, suffix)) {
            return file.substr(0, file.size() - suffix.size());
        }
    }

    size_t dot = file.find_last_of('.');
    return dot == std::string::npos ? file : file.substr(0, dot);
}

bool ArtifactNaming::isOwnedBy(const std::string& name, const std::string& ownerId) {
    if (ownerId.empty()) {
        return false;
    }
    size_t slash = name.find_last_of('/');
    std::string file = slash == std::string::npos ? name : name.substr(slash + 1);
    // The separator keeps owner "ana" from matching "anabela_..."
    std::string prefix = ownerId + "_";
    return file.compare(0, prefix.size(), prefix) == 0;
}

std::string ArtifactNaming::subjectFromBase(const std::string& base, const std::string& ownerId) {
    std::string prefix = ownerId + "_";
    if (base.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    std::string rest = base.substr(prefix.size());
    if (rest.size() > kTimestampSuffixLength &&
        isTimestampSuffix(rest.substr(rest.size() - kTimestampSuffixLength))) {
        rest = rest.substr(0, rest.size() - kTimestampSuffixLength);
    }
    if (rest == kDefaultSubject) {
        return "";
    }
    return rest;
}

std::string ArtifactNaming::exportTitle(const std::string& subject, const std::string& prefix) {
    if (subject.empty()) {
        return prefix + " - Conversa";
    }
    std::string shown = subject;
    for (char& c : shown) {
        if (c == '_') c = ' ';
    }
    return prefix + " - " + shown;
}

std::string ArtifactNaming::formatTimestamp(std::chrono::system_clock::time_point tp, const char* format) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

std::string ArtifactNaming::buildConversationRecord(const std::string& transcript,
                                                    const std::string& summary,
                                                    std::chrono::system_clock::time_point generatedAt) {
    const std::string rule(80, '=');
    std::ostringstream record;
    record << "# CONVERSA COMPLETA - " << formatTimestamp(generatedAt, "%d/%m/%Y às %H:%M") << "\n\n"
           << "## 📄 TRANSCRIÇÃO ORIGINAL\n\n"
           << transcript << "\n\n"
           << rule << "\n\n"
           << "## 📋 RESUMO GERADO PELA IA\n\n"
           << summary << "\n\n"
           << rule << "\n\n"
           << "Arquivo gerado automaticamente pelo sistema MedScribe\n"
           << "Contém a transcrição original e o resumo gerado pela IA para referência futura.\n";
    return record.str();
}

} // namespace core
} // namespace medscribe

#pragma once

#include <chrono>
#include <string>

namespace medscribe {
namespace core {

enum class ArtifactKind {
    RECORDING,
    TRANSCRIPT,
    SUMMARY,
    CONVERSATION,
    PDF_EXPORT,
    DOCX_EXPORT
};

/**
 * Deterministic names for everything derived from one recording.
 *
 * Base name: {owner}_{subject|conversa}_{YYYYmmdd_HHMMSS}. Every artifact is
 * the base plus a fixed suffix, so a derived name always maps back to its
 * recording.
 */
class ArtifactNaming {
public:
    static constexpr const char* kDefaultSubject = "conversa";

    /**
     * Keep letters, digits, spaces, '_' and '-'; trim; spaces become '_'.
     * Non-ASCII UTF-8 letters are kept.
     */
    static std::string sanitizeSubject(const std::string& subject);

    static std::string baseName(const std::string& ownerId,
                                const std::string& subject,
                                std::chrono::system_clock::time_point createdAt);

    static std::string artifactName(const std::string& base, ArtifactKind kind);
    static std::string suffixFor(ArtifactKind kind);

    /**
     * Strip a known artifact suffix (or a file extension) from a name
     */
    static std::string baseFromArtifact(const std::string& name);

    static bool isOwnedBy(const std::string& name, const std::string& ownerId);

    /**
     * Subject part of a base name for this owner, "" for the default subject
     */
    static std::string subjectFromBase(const std::string& base, const std::string& ownerId);

    /**
     * "{prefix} - {subject}" with '_' shown as spaces, or "{prefix} - Conversa"
     */
    static std::string exportTitle(const std::string& subject,
                                   const std::string& prefix = "Resumo da Consulta");

    static std::string formatTimestamp(std::chrono::system_clock::time_point tp, const char* format);

    /**
     * Combined record of transcript and generated summary, stored next to the
     * summary for later reference.
     */
    static std::string buildConversationRecord(const std::string& transcript,
                                               const std::string& summary,
                                               std::chrono::system_clock::time_point generatedAt);
};

} // namespace core
} // namespace medscribe

#pragma once

#include <string>

namespace medscribe {
namespace refine {
namespace prompts {

// Correct grammar, punctuation and structure; keep clinical terminology
std::string buildImprovePrompt(const std::string& transcript);

// Eight-section visit summary in "## / ### / **" markup
std::string buildDefaultSummaryPrompt(const std::string& transcript);

// The caller's instruction is embedded verbatim
std::string buildCustomSummaryPrompt(const std::string& instruction, const std::string& transcript);

} // namespace prompts
} // namespace refine
} // namespace medscribe

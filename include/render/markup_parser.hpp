#pragma once

#include "render/document_model.hpp"
#include <string>
#include <vector>

namespace medscribe {
namespace render {

/**
 * Single-pass, line-oriented scan of the summary markup.
 *
 *   blank line        -> SPACER
 *   "## text"         -> HEADING
 *   "### text"        -> SUBHEADING
 *   "**text**"        -> EMPHASIS
 *   anything else     -> PARAGRAPH
 *
 * Lines are trimmed before matching. Unknown markers fall through to
 * PARAGRAPH unchanged.
 */
std::vector<Block> parseMarkup(const std::string& markup);

} // namespace render
} // namespace medscribe

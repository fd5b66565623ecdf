#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace medscribe {
namespace render {
namespace utf8 {

/**
 * Decode the code point starting at pos and advance pos past it.
 *
 * Invalid input (stray continuation bytes, truncated or overlong sequences,
 * surrogates, values above U+10FFFF) advances pos by one byte and returns false.
 */
bool decodeNext(const std::string& text, size_t& pos, uint32_t& codepoint);

// Characters allowed in XML 1.0 content
bool isXmlChar(uint32_t codepoint);

} // namespace utf8
} // namespace render
} // namespace medscribe

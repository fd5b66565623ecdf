#include "render/utf8.hpp"

namespace medscribe {
namespace render {
namespace utf8 {

bool decodeNext(const std::string& text, size_t& pos, uint32_t& codepoint) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;
    uint32_t minimum = 0;

    if (lead < 0x80) {
        codepoint = lead;
        ++pos;
        return true;
    } else if ((lead & 0xE0) == 0xC0) {
        codepoint = lead & 0x1F;
        length = 2;
        minimum = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        codepoint = lead & 0x0F;
        length = 3;
        minimum = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        codepoint = lead & 0x07;
        length = 4;
        minimum = 0x10000;
    } else {
        ++pos;
        return false;
    }

    if (pos + length > text.size()) {
        ++pos;
        return false;
    }

    for (size_t k = 1; k < length; ++k) {
        unsigned char cont = static_cast<unsigned char>(text[pos + k]);
        if ((cont & 0xC0) != 0x80) {
            ++pos;
            return false;
        }
        codepoint = (codepoint << 6) | (cont & 0x3F);
    }

    if (codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        ++pos;
        return false;
    }

    pos += length;
    return true;
}

bool isXmlChar(uint32_t codepoint) {
    if (codepoint < 0x20) {
        return codepoint == '\t' || codepoint == '\n' || codepoint == '\r';
    }
    return codepoint <= 0xD7FF ||
           (codepoint >= 0xE000 && codepoint <= 0xFFFD) ||
           (codepoint >= 0x10000 && codepoint <= 0x10FFFF);
}

} // namespace utf8
} // namespace render
} // namespace medscribe

#pragma once

#include "render/document_model.hpp"
#include <string>
#include <vector>

namespace medscribe {
namespace render {

/**
 * Paragraph style for the PDF layout, in points
 */
struct PdfTextStyle {
    bool bold;
    float fontSize;
    float leading;
    float spaceBefore;
    float spaceAfter;
    float red;
    float green;
    float blue;
    bool centered;
};

/**
 * A4 PDF writer using the standard Helvetica fonts (no embedding). Text is
 * word wrapped against the Helvetica metrics and flows onto new pages as
 * needed. Content streams are Flate compressed.
 */
class PdfWriter {
public:
    static constexpr float kPageWidth = 595.28f;
    static constexpr float kPageHeight = 841.89f;
    static constexpr float kMargin = 72.0f;

    std::vector<uint8_t> write(const DocumentContent& content) const;

    static PdfTextStyle titleStyle();
    static PdfTextStyle headingStyle();
    static PdfTextStyle subheadingStyle();
    static PdfTextStyle bodyStyle();
    static PdfTextStyle emphasisStyle();

    /**
     * UTF-8 to WinAnsiEncoding. Characters without a WinAnsi code point
     * (emoji, CJK, ...) are dropped.
     */
    static std::string toWinAnsi(const std::string& utf8);

    // Width in points of WinAnsi text set in Helvetica or Helvetica-Bold
    static float textWidth(const std::string& winAnsi, bool bold, float fontSize);

    static std::vector<std::string> wrapText(const std::string& winAnsi, bool bold,
                                             float fontSize, float maxWidth);

    // PDF literal string body: escapes parentheses, backslash and non-ASCII bytes
    static std::string escapeString(const std::string& winAnsi);

    static std::vector<uint8_t> compress(const std::string& data);
};

} // namespace render
} // namespace medscribe

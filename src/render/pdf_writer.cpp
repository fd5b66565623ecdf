#include "render/pdf_writer.hpp"
#include "render/utf8.hpp"
#include "utils/error_handler.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <zlib.h>

namespace medscribe {
namespace render {

namespace {

// Helvetica advance widths (1/1000 em), WinAnsi 32..126
const uint16_t kHelveticaAscii[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    278, 278, 584, 584, 584, 556, 1015,
    667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    278, 278, 278, 469, 556, 333,
    556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833,
    556, 556, 556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500,
    334, 260, 334, 584
};

const uint16_t kHelveticaBoldAscii[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556,
    333, 333, 584, 584, 584, 611, 975,
    722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833,
    722, 778, 667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611,
    333, 278, 333, 584, 556, 333,
    556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889,
    611, 611, 611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500,
    389, 280, 389, 584
};

// WinAnsi 128..159; 0 marks unassigned codes
const uint16_t kHelveticaHigh[32] = {
    556, 0, 222, 556, 333, 1000, 556, 556, 333, 1000, 667, 333, 1000, 0, 611, 0,
    0, 222, 222, 333, 333, 350, 556, 1000, 333, 1000, 500, 333, 944, 0, 500, 667
};

const uint16_t kHelveticaBoldHigh[32] = {
    556, 0, 278, 556, 500, 1000, 556, 556, 333, 1000, 667, 333, 1000, 0, 611, 0,
    0, 278, 278, 500, 500, 350, 556, 1000, 333, 1000, 556, 333, 944, 0, 500, 667
};

// WinAnsi 160..255
const uint16_t kHelveticaLatin1[96] = {
    278, 333, 556, 556, 556, 556, 260, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    400, 584, 333, 333, 333, 556, 537, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    667, 667, 667, 667, 667, 667, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    556, 556, 556, 556, 556, 556, 889, 500, 556, 556, 556, 556, 278, 278, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 584, 611, 556, 556, 556, 556, 500, 556, 500
};

const uint16_t kHelveticaBoldLatin1[96] = {
    278, 333, 556, 556, 556, 556, 280, 556, 333, 737, 370, 556, 584, 333, 737, 333,
    400, 584, 333, 333, 333, 611, 556, 278, 333, 333, 365, 556, 834, 834, 834, 611,
    722, 722, 722, 722, 722, 722, 1000, 722, 667, 667, 667, 667, 278, 278, 278, 278,
    722, 722, 778, 778, 778, 778, 778, 584, 778, 722, 722, 722, 722, 667, 667, 611,
    556, 556, 556, 556, 556, 556, 889, 556, 556, 556, 556, 556, 278, 278, 278, 278,
    611, 611, 611, 611, 611, 611, 611, 584, 611, 611, 611, 611, 611, 556, 611, 556
};

constexpr uint16_t kDefaultWidth = 556;

uint16_t glyphWidth(unsigned char c, bool bold) {
    if (c >= 32 && c <= 126) {
        return bold ? kHelveticaBoldAscii[c - 32] : kHelveticaAscii[c - 32];
    }
    if (c >= 128 && c <= 159) {
        uint16_t w = bold ? kHelveticaBoldHigh[c - 128] : kHelveticaHigh[c - 128];
        return w == 0 ? kDefaultWidth : w;
    }
    if (c >= 160) {
        return bold ? kHelveticaBoldLatin1[c - 160] : kHelveticaLatin1[c - 160];
    }
    return kDefaultWidth;
}

// Code points that WinAnsi places in 0x80..0x9F
int winAnsiHighCode(uint32_t codepoint) {
    switch (codepoint) {
        case 0x20AC: return 0x80;
        case 0x201A: return 0x82;
        case 0x0192: return 0x83;
        case 0x201E: return 0x84;
        case 0x2026: return 0x85;
        case 0x2020: return 0x86;
        case 0x2021: return 0x87;
        case 0x02C6: return 0x88;
        case 0x2030: return 0x89;
        case 0x0160: return 0x8A;
        case 0x2039: return 0x8B;
        case 0x0152: return 0x8C;
        case 0x017D: return 0x8E;
        case 0x2018: return 0x91;
        case 0x2019: return 0x92;
        case 0x201C: return 0x93;
        case 0x201D: return 0x94;
        case 0x2022: return 0x95;
        case 0x2013: return 0x96;
        case 0x2014: return 0x97;
        case 0x02DC: return 0x98;
        case 0x2122: return 0x99;
        case 0x0161: return 0x9A;
        case 0x203A: return 0x9B;
        case 0x0153: return 0x9C;
        case 0x017E: return 0x9E;
        case 0x0178: return 0x9F;
        default: return -1;
    }
}

std::string trimSpaces(const std::string& text) {
    size_t start = text.find_first_not_of(' ');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(' ');
    return text.substr(start, end - start + 1);
}

std::string number(float value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

struct PlacedLine {
    std::string text;
    const PdfTextStyle* style;
    float x;
    float baseline;
};

struct Page {
    std::vector<PlacedLine> lines;
};

/**
 * Top-down flow of styled paragraphs over A4 pages
 */
class Layout {
public:
    Layout() { newPage(); }

    void addParagraph(const std::string& source, const PdfTextStyle& style) {
        std::string text = trimSpaces(PdfWriter::toWinAnsi(source));
        if (text.empty()) {
            return;
        }

        if (!atTop_) {
            cursor_ -= style.spaceBefore;
        }

        const float contentWidth = PdfWriter::kPageWidth - 2 * PdfWriter::kMargin;
        for (const auto& line : PdfWriter::wrapText(text, style.bold, style.fontSize, contentWidth)) {
            if (cursor_ - style.leading < PdfWriter::kMargin) {
                newPage();
            }
            float x = PdfWriter::kMargin;
            if (style.centered) {
                x += (contentWidth - PdfWriter::textWidth(line, style.bold, style.fontSize)) / 2;
            }
            pages_.back().lines.push_back({line, &style, x, cursor_ - style.fontSize});
            cursor_ -= style.leading;
            atTop_ = false;
        }

        cursor_ -= style.spaceAfter;
    }

    void addSpace(float height) {
        if (atTop_) {
            return;
        }
        cursor_ -= height;
        if (cursor_ < PdfWriter::kMargin) {
            cursor_ = PdfWriter::kMargin;
        }
    }

    const std::vector<Page>& getPages() const { return pages_; }

private:
    void newPage() {
        pages_.emplace_back();
        cursor_ = PdfWriter::kPageHeight - PdfWriter::kMargin;
        atTop_ = true;
    }

    std::vector<Page> pages_;
    float cursor_ = 0.0f;
    bool atTop_ = true;
};

std::string buildContentStream(const Page& page) {
    std::string stream;
    for (const auto& line : page.lines) {
        const PdfTextStyle& style = *line.style;
        stream += "BT\n";
        stream += std::string(style.bold ? "/F2 " : "/F1 ") + number(style.fontSize) + " Tf\n";
        stream += number(style.red) + " " + number(style.green) + " " + number(style.blue) + " rg\n";
        stream += number(line.x) + " " + number(line.baseline) + " Td\n";
        stream += "(" + PdfWriter::escapeString(line.text) + ") Tj\n";
        stream += "ET\n";
    }
    return stream;
}

std::string pdfDate(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm local{};
    localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "D:%Y%m%d%H%M%S");
    return oss.str();
}

} // namespace

PdfTextStyle PdfWriter::titleStyle() {
    return {true, 18.0f, 22.0f, 0.0f, 30.0f, 0.082f, 0.396f, 0.753f, true};
}

PdfTextStyle PdfWriter::headingStyle() {
    return {true, 14.0f, 17.0f, 20.0f, 12.0f, 0.129f, 0.588f, 0.953f, false};
}

PdfTextStyle PdfWriter::subheadingStyle() {
    return {true, 12.0f, 15.0f, 15.0f, 8.0f, 0.259f, 0.647f, 0.961f, false};
}

PdfTextStyle PdfWriter::bodyStyle() {
    return {false, 11.0f, 16.0f, 0.0f, 8.0f, 0.0f, 0.0f, 0.0f, false};
}

PdfTextStyle PdfWriter::emphasisStyle() {
    return {true, 11.0f, 16.0f, 0.0f, 8.0f, 0.0f, 0.0f, 0.0f, false};
}

std::string PdfWriter::toWinAnsi(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        uint32_t codepoint = 0;
        if (!utf8::decodeNext(text, i, codepoint)) {
            continue;
        }

        if (codepoint == '\t') {
            out += ' ';
        } else if (codepoint >= 0x20 && codepoint <= 0x7E) {
            out += static_cast<char>(codepoint);
        } else if (codepoint >= 0xA0 && codepoint <= 0xFF) {
            out += static_cast<char>(codepoint);
        } else {
            int high = winAnsiHighCode(codepoint);
            if (high >= 0) {
                out += static_cast<char>(high);
            }
        }
    }

    return out;
}

float PdfWriter::textWidth(const std::string& winAnsi, bool bold, float fontSize) {
    uint32_t units = 0;
    for (char c : winAnsi) {
        units += glyphWidth(static_cast<unsigned char>(c), bold);
    }
    return static_cast<float>(units) * fontSize / 1000.0f;
}

std::vector<std::string> PdfWriter::wrapText(const std::string& winAnsi, bool bold,
                                             float fontSize, float maxWidth) {
    std::vector<std::string> lines;
    std::istringstream words(winAnsi);
    std::string word;
    std::string current;

    while (words >> word) {
        std::string candidate = current.empty() ? word : current + " " + word;
        if (textWidth(candidate, bold, fontSize) <= maxWidth) {
            current = candidate;
            continue;
        }

        if (!current.empty()) {
            lines.push_back(current);
            current.clear();
        }

        // Words wider than the line are broken at character boundaries
        while (textWidth(word, bold, fontSize) > maxWidth) {
            size_t fit = 1;
            while (fit < word.size() && textWidth(word.substr(0, fit + 1), bold, fontSize) <= maxWidth) {
                ++fit;
            }
            lines.push_back(word.substr(0, fit));
            word = word.substr(fit);
        }
        current = word;
    }

    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

std::string PdfWriter::escapeString(const std::string& winAnsi) {
    std::string out;
    out.reserve(winAnsi.size());
    for (char c : winAnsi) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '(' || c == ')' || c == '\\') {
            out += '\\';
            out += c;
        } else if (uc < 0x20 || uc > 0x7E) {
            char octal[5];
            std::snprintf(octal, sizeof(octal), "\\%03o", uc);
            out += octal;
        } else {
            out += c;
        }
    }
    return out;
}

std::vector<uint8_t> PdfWriter::compress(const std::string& data) {
    uLongf size = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> out(size);
    int rc = compress2(out.data(), &size, reinterpret_cast<const Bytef*>(data.data()),
                       static_cast<uLong>(data.size()), Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
        throw utils::RenderException("zlib compress2 failed with code " + std::to_string(rc), "pdf");
    }
    out.resize(size);
    return out;
}

std::vector<uint8_t> PdfWriter::write(const DocumentContent& content) const {
    const PdfTextStyle title = titleStyle();
    const PdfTextStyle heading = headingStyle();
    const PdfTextStyle subheading = subheadingStyle();
    const PdfTextStyle body = bodyStyle();
    const PdfTextStyle emphasis = emphasisStyle();

    Layout layout;
    layout.addParagraph(content.title, title);
    layout.addSpace(12.0f);
    layout.addParagraph(content.dateLine, body);
    layout.addSpace(20.0f);

    for (const auto& block : content.blocks) {
        switch (block.type) {
            case BlockType::HEADING: layout.addParagraph(block.text, heading); break;
            case BlockType::SUBHEADING: layout.addParagraph(block.text, subheading); break;
            case BlockType::EMPHASIS: layout.addParagraph(block.text, emphasis); break;
            case BlockType::PARAGRAPH: layout.addParagraph(block.text, body); break;
            case BlockType::SPACER: layout.addSpace(6.0f); break;
        }
    }

    const auto& pages = layout.getPages();
    const size_t pageCount = pages.size();
    // 1 catalog, 2 pages, 3-4 fonts, 5 info, then page/content pairs
    const size_t objectCount = 5 + 2 * pageCount;
    std::vector<size_t> offsets(objectCount + 1, 0);

    std::string out = "%PDF-1.4\n%\xE2\xE3\xCF\xD3\n";

    auto beginObject = [&](size_t id) {
        offsets[id] = out.size();
        out += std::to_string(id) + " 0 obj\n";
    };
    auto endObject = [&]() { out += "endobj\n"; };
    auto pageId = [](size_t index) { return 6 + 2 * index; };

    beginObject(1);
    out += "<< /Type /Catalog /Pages 2 0 R >>\n";
    endObject();

    beginObject(2);
    out += "<< /Type /Pages /Kids [";
    for (size_t i = 0; i < pageCount; ++i) {
        out += (i == 0 ? "" : " ") + std::to_string(pageId(i)) + " 0 R";
    }
    out += "] /Count " + std::to_string(pageCount) + " >>\n";
    endObject();

    beginObject(3);
    out += "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica /Encoding /WinAnsiEncoding >>\n";
    endObject();

    beginObject(4);
    out += "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica-Bold /Encoding /WinAnsiEncoding >>\n";
    endObject();

    beginObject(5);
    out += "<< /Title (" + escapeString(toWinAnsi(content.title)) + ") /Producer (MedScribe) /CreationDate (" +
           pdfDate(content.generatedAt) + ") >>\n";
    endObject();

    const std::string mediaBox = "[0 0 " + number(kPageWidth) + " " + number(kPageHeight) + "]";
    for (size_t i = 0; i < pageCount; ++i) {
        size_t id = pageId(i);

        beginObject(id);
        out += "<< /Type /Page /Parent 2 0 R /MediaBox " + mediaBox +
               " /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >> /Contents " +
               std::to_string(id + 1) + " 0 R >>\n";
        endObject();

        std::vector<uint8_t> stream = compress(buildContentStream(pages[i]));
        beginObject(id + 1);
        out += "<< /Length " + std::to_string(stream.size()) + " /Filter /FlateDecode >>\nstream\n";
        out.append(reinterpret_cast<const char*>(stream.data()), stream.size());
        out += "\nendstream\n";
        endObject();
    }

    size_t xrefOffset = out.size();
    out += "xref\n0 " + std::to_string(objectCount + 1) + "\n";
    out += "0000000000 65535 f \n";
    for (size_t id = 1; id <= objectCount; ++id) {
        char entry[21];
        std::snprintf(entry, sizeof(entry), "%010zu 00000 n \n", offsets[id]);
        out += entry;
    }
    out += "trailer\n<< /Size " + std::to_string(objectCount + 1) + " /Root 1 0 R /Info 5 0 R >>\n";
    out += "startxref\n" + std::to_string(xrefOffset) + "\n%%EOF\n";

    return std::vector<uint8_t>(out.begin(), out.end());
}

} // namespace render
} // namespace medscribe

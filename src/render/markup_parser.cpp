#include "render/markup_parser.hpp"

namespace medscribe {
namespace render {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool isEmphasis(const std::string& line) {
    return line.size() > 4 && startsWith(line, "**") &&
           line.compare(line.size() - 2, 2, "**") == 0 &&
           !trim(line.substr(2, line.size() - 4)).empty();
}

} // namespace

std::vector<Block> parseMarkup(const std::string& markup) {
    std::vector<Block> blocks;
    if (markup.empty()) {
        return blocks;
    }

    size_t pos = 0;
    while (pos <= markup.size()) {
        size_t newline = markup.find('\n', pos);
        size_t end = newline == std::string::npos ? markup.size() : newline;
        std::string line = trim(markup.substr(pos, end - pos));

        if (line.empty()) {
            blocks.push_back({BlockType::SPACER, ""});
        } else if (startsWith(line, "## ")) {
            blocks.push_back({BlockType::HEADING, trim(line.substr(3))});
        } else if (startsWith(line, "### ")) {
            blocks.push_back({BlockType::SUBHEADING, trim(line.substr(4))});
        } else if (isEmphasis(line)) {
            blocks.push_back({BlockType::EMPHASIS, trim(line.substr(2, line.size() - 4))});
        } else {
            blocks.push_back({BlockType::PARAGRAPH, line});
        }

        if (newline == std::string::npos) {
            break;
        }
        pos = newline + 1;
    }

    // A trailing newline does not open another line
    if (markup.back() == '\n' && !blocks.empty() &&
        blocks.back().type == BlockType::SPACER) {
        blocks.pop_back();
    }

    return blocks;
}

std::string blockTypeToString(BlockType type) {
    switch (type) {
        case BlockType::HEADING: return "HEADING";
        case BlockType::SUBHEADING: return "SUBHEADING";
        case BlockType::EMPHASIS: return "EMPHASIS";
        case BlockType::PARAGRAPH: return "PARAGRAPH";
        case BlockType::SPACER: return "SPACER";
    }
    return "UNKNOWN";
}

} // namespace render
} // namespace medscribe

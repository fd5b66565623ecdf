#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace render {

enum class BlockType {
    HEADING,
    SUBHEADING,
    EMPHASIS,
    PARAGRAPH,
    SPACER
};

struct Block {
    BlockType type;
    std::string text;

    bool operator==(const Block& other) const {
        return type == other.type && text == other.text;
    }
    bool operator!=(const Block& other) const { return !(*this == other); }
};

enum class DocumentEncoding {
    PDF,
    DOCX
};

/**
 * Everything an encoder needs: the header lines and the parsed body
 */
struct DocumentContent {
    std::string title;
    std::string dateLine;
    std::vector<Block> blocks;
    std::chrono::system_clock::time_point generatedAt;
};

/**
 * Rendered document. Derived data: always regenerable from its markup.
 */
struct ExportedDocument {
    DocumentEncoding encoding;
    DocumentContent content;
    std::vector<uint8_t> bytes;
};

std::string blockTypeToString(BlockType type);
std::string encodingToString(DocumentEncoding encoding);
std::string fileExtension(DocumentEncoding encoding);

} // namespace render
} // namespace medscribe

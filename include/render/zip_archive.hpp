#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace render {

/**
 * In-memory ZIP writer (stored or raw-deflate entries, no ZIP64). Entry
 * order and timestamps are caller controlled, so output is reproducible.
 */
class ZipArchive {
public:
    explicit ZipArchive(std::chrono::system_clock::time_point modified);

    /**
     * @throws utils::RenderException when compression fails
     */
    void addFile(const std::string& name, const std::string& content, bool compress = true);

    std::vector<uint8_t> finish();

    size_t getEntryCount() const { return entries_.size(); }

    static uint32_t crc32Of(const std::string& content);
    static std::vector<uint8_t> deflateRaw(const std::string& content);

private:
    struct Entry {
        std::string name;
        uint16_t method;
        uint32_t crc;
        uint32_t compressedSize;
        uint32_t uncompressedSize;
        uint32_t localHeaderOffset;
    };

    std::vector<uint8_t> buffer_;
    std::vector<Entry> entries_;
    uint16_t dosTime_;
    uint16_t dosDate_;
    bool finished_;
};

} // namespace render
} // namespace medscribe

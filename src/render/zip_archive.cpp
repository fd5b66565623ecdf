#include "render/zip_archive.hpp"
#include "utils/error_handler.hpp"
#include <ctime>
#include <zlib.h>

namespace medscribe {
namespace render {

namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralHeaderSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;
constexpr uint16_t kVersion = 20;
constexpr uint16_t kFlagUtf8Names = 0x0800;
constexpr uint16_t kMethodStored = 0;
constexpr uint16_t kMethodDeflated = 8;

void put16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void put32(std::vector<uint8_t>& out, uint32_t value) {
    put16(out, static_cast<uint16_t>(value & 0xFFFF));
    put16(out, static_cast<uint16_t>((value >> 16) & 0xFFFF));
}

} // namespace

ZipArchive::ZipArchive(std::chrono::system_clock::time_point modified)
    : dosTime_(0)
    , dosDate_(0)
    , finished_(false) {
    std::time_t t = std::chrono::system_clock::to_time_t(modified);
    std::tm local{};
    localtime_r(&t, &local);

    int year = local.tm_year + 1900;
    if (year < 1980) {
        // DOS dates start at 1980-01-01 00:00
        dosDate_ = static_cast<uint16_t>((1 << 5) | 1);
        dosTime_ = 0;
    } else {
        dosDate_ = static_cast<uint16_t>(((year - 1980) << 9) | ((local.tm_mon + 1) << 5) | local.tm_mday);
        dosTime_ = static_cast<uint16_t>((local.tm_hour << 11) | (local.tm_min << 5) | (local.tm_sec / 2));
    }
}

uint32_t ZipArchive::crc32Of(const std::string& content) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
    return static_cast<uint32_t>(crc);
}

std::vector<uint8_t> ZipArchive::deflateRaw(const std::string& content) {
    z_stream stream{};
    // Negative window bits: raw deflate without zlib header, as ZIP requires
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw utils::RenderException("deflateInit2 failed", "zip");
    }

    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(content.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(content.data()));
    stream.avail_in = static_cast<uInt>(content.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw utils::RenderException("deflate failed with code " + std::to_string(rc), "zip");
    }

    out.resize(stream.total_out);
    return out;
}

void ZipArchive::addFile(const std::string& name, const std::string& content, bool compress) {
    if (finished_) {
        throw utils::RenderException("Cannot add " + name + " to a finished archive", "zip");
    }

    Entry entry;
    entry.name = name;
    entry.crc = crc32Of(content);
    entry.uncompressedSize = static_cast<uint32_t>(content.size());
    entry.localHeaderOffset = static_cast<uint32_t>(buffer_.size());

    std::vector<uint8_t> payload;
    if (compress && !content.empty()) {
        payload = deflateRaw(content);
        entry.method = kMethodDeflated;
    } else {
        payload.assign(content.begin(), content.end());
        entry.method = kMethodStored;
    }
    entry.compressedSize = static_cast<uint32_t>(payload.size());

    put32(buffer_, kLocalHeaderSignature);
    put16(buffer_, kVersion);
    put16(buffer_, kFlagUtf8Names);
    put16(buffer_, entry.method);
    put16(buffer_, dosTime_);
    put16(buffer_, dosDate_);
    put32(buffer_, entry.crc);
    put32(buffer_, entry.compressedSize);
    put32(buffer_, entry.uncompressedSize);
    put16(buffer_, static_cast<uint16_t>(name.size()));
    put16(buffer_, 0);
    buffer_.insert(buffer_.end(), name.begin(), name.end());
    buffer_.insert(buffer_.end(), payload.begin(), payload.end());

    entries_.push_back(entry);
}

std::vector<uint8_t> ZipArchive::finish() {
    if (finished_) {
        throw utils::RenderException("Archive already finished", "zip");
    }
    finished_ = true;

    uint32_t centralOffset = static_cast<uint32_t>(buffer_.size());
    for (const auto& entry : entries_) {
        put32(buffer_, kCentralHeaderSignature);
        put16(buffer_, kVersion);
        put16(buffer_, kVersion);
        put16(buffer_, kFlagUtf8Names);
        put16(buffer_, entry.method);
        put16(buffer_, dosTime_);
        put16(buffer_, dosDate_);
        put32(buffer_, entry.crc);
        put32(buffer_, entry.compressedSize);
        put32(buffer_, entry.uncompressedSize);
        put16(buffer_, static_cast<uint16_t>(entry.name.size()));
        put16(buffer_, 0);  // extra
        put16(buffer_, 0);  // comment
        put16(buffer_, 0);  // disk
        put16(buffer_, 0);  // internal attributes
        put32(buffer_, 0);  // external attributes
        put32(buffer_, entry.localHeaderOffset);
        buffer_.insert(buffer_.end(), entry.name.begin(), entry.name.end());
    }
    uint32_t centralSize = static_cast<uint32_t>(buffer_.size()) - centralOffset;

    put32(buffer_, kEndOfCentralDirSignature);
    put16(buffer_, 0);
    put16(buffer_, 0);
    put16(buffer_, static_cast<uint16_t>(entries_.size()));
    put16(buffer_, static_cast<uint16_t>(entries_.size()));
    put32(buffer_, centralSize);
    put32(buffer_, centralOffset);
    put16(buffer_, 0);

    return std::move(buffer_);
}

} // namespace render
} // namespace medscribe

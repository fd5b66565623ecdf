#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace utils {

/**
 * Uniquely named file in the system temp directory, removed when the object goes
 * out of scope on every exit path.
 */
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::string& suffix = "");
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::string& path() const { return path_; }

    void write(const std::vector<uint8_t>& data) const;
    std::vector<uint8_t> read() const;

private:
    std::string path_;
};

} // namespace utils
} // namespace medscribe

#include "utils/scoped_temp_file.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <unistd.h>

namespace medscribe {
namespace utils {

ScopedTempFile::ScopedTempFile(const std::string& suffix) {
    std::filesystem::path pattern =
        std::filesystem::temp_directory_path() / ("medscribe_XXXXXX" + suffix);
    std::string templ = pattern.string();

    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');

    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw MedScribeException(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::ERROR,
                                           "Failed to create temporary file",
                                           std::strerror(errno), "ScopedTempFile"));
    }
    close(fd);
    path_ = buffer.data();
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        Logger::warn("Failed to remove temporary file " + path_ + ": " + ec.message());
    }
}

void ScopedTempFile::write(const std::vector<uint8_t>& data) const {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw MedScribeException(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::ERROR,
                                           "Failed to open temporary file for writing",
                                           path_, "ScopedTempFile"));
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw MedScribeException(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::ERROR,
                                           "Failed to write temporary file",
                                           path_, "ScopedTempFile"));
    }
}

std::vector<uint8_t> ScopedTempFile::read() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw MedScribeException(ErrorInfo(ErrorCategory::SYSTEM, ErrorSeverity::ERROR,
                                           "Failed to open temporary file for reading",
                                           path_, "ScopedTempFile"));
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                std::istreambuf_iterator<char>());
}

} // namespace utils
} // namespace medscribe

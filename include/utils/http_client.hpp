#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace utils {

/**
 * Outcome of one HTTP exchange. Transport problems never throw; callers map
 * them onto their own error taxonomy.
 */
struct HttpResult {
    bool transportOk = false;
    bool timedOut = false;
    long statusCode = 0;
    std::string body;
    std::string error;

    bool isSuccess() const { return transportOk && statusCode >= 200 && statusCode < 300; }
};

/**
 * Minimal libcurl wrapper. Every request carries its own deadline; no timeout
 * state is shared between calls.
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResult postJson(const std::string& url,
                        const std::string& payload,
                        const std::vector<std::string>& headers,
                        std::chrono::milliseconds deadline) const;

    static std::string urlEncode(const std::string& value);

private:
    bool globalAcquired_;
};

/**
 * Standard base64 (RFC 4648) with padding.
 */
std::string base64Encode(const std::vector<uint8_t>& data);

} // namespace utils
} // namespace medscribe

#include "utils/http_client.hpp"
#include "utils/logging.hpp"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace medscribe {
namespace utils {

namespace {

std::mutex g_curl_mutex;
int g_curl_refcount = 0;

bool acquireCurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount == 0) {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            Logger::error(std::string("curl_global_init failed: ") + curl_easy_strerror(rc));
            return false;
        }
    }
    ++g_curl_refcount;
    return true;
}

void releaseCurlGlobal() {
    std::lock_guard<std::mutex> lock(g_curl_mutex);
    if (g_curl_refcount <= 0) {
        return;
    }
    if (--g_curl_refcount == 0) {
        curl_global_cleanup();
    }
}

size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* response) {
    size_t total = size * nmemb;
    response->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

HttpClient::HttpClient() : globalAcquired_(acquireCurlGlobal()) {
}

HttpClient::~HttpClient() {
    if (globalAcquired_) {
        releaseCurlGlobal();
    }
}

HttpResult HttpClient::postJson(const std::string& url,
                                const std::string& payload,
                                const std::vector<std::string>& headers,
                                std::chrono::milliseconds deadline) const {
    HttpResult result;

    if (!globalAcquired_) {
        result.error = "libcurl is not initialized";
        return result;
    }

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        result.error = "Failed to initialize curl handle";
        return result;
    }

    curl_slist* rawList = curl_slist_append(nullptr, "Content-Type: application/json");
    for (const auto& header : headers) {
        rawList = curl_slist_append(rawList, header.c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headerList(rawList);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(deadline.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    Logger::debug("POST " + url + " (" + std::to_string(payload.size()) + " bytes, deadline " +
                  std::to_string(deadline.count()) + " ms)");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        result.timedOut = (res == CURLE_OPERATION_TIMEDOUT);
        result.error = curl_easy_strerror(res);
        return result;
    }

    result.transportOk = true;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.statusCode);
    Logger::debug("HTTP " + std::to_string(result.statusCode) + " (" +
                  std::to_string(result.body.size()) + " bytes)");
    return result;
}

std::string HttpClient::urlEncode(const std::string& value) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        return value;
    }
    char* escaped = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        return value;
    }
    std::string out(escaped);
    curl_free(escaped);
    return out;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t triple = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) triple |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) triple |= static_cast<uint32_t>(data[i + 2]);

        out += table[(triple >> 18) & 0x3F];
        out += table[(triple >> 12) & 0x3F];
        out += (i + 1 < data.size()) ? table[(triple >> 6) & 0x3F] : '=';
        out += (i + 2 < data.size()) ? table[triple & 0x3F] : '=';
    }

    return out;
}

} // namespace utils
} // namespace medscribe

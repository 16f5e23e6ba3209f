#pragma once
#include <string>
#include <mutex>
#include <array>
#include "../interfaces/IHttpTransport.hpp"

// Forward declare CURLSH
typedef void CURLSH;

namespace MangaHarvest {

class CurlTransport : public IHttpTransport {
public:
    struct Options {
        std::string user_agent = "mangaha-api/1.0 (+https://example.com)";
        long max_redirects = 5;
        size_t max_bytes = 64 * 1024 * 1024;
    };

    // curl_global_init must have been called before the first instance is created.
    explicit CurlTransport(Options options);
    ~CurlTransport() override;

    // Non-copyable
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse Get(const std::string& url, long timeout_ms) override;

    // One mutex per curl_lock_data value; CURL_LOCK_DATA_LAST is well below 16.
    using ShareLocks = std::array<std::mutex, 16>;

private:
    Options options_;
    CURLSH* share_handle_ = nullptr;
    ShareLocks share_locks_;
};

}

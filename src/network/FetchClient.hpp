#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <functional>
#include "../interfaces/IHttpTransport.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../utils/UrlUtil.hpp"

namespace MangaHarvest {

struct RetryPolicy {
    int max_attempts = 3;
    double backoff_factor = 0.3;
    std::vector<long> retry_statuses = {500, 502, 504};

    bool IsRetryableStatus(long status) const;
    // Delay before the attempt following attempt number `attempt` (1-based):
    // backoff_factor * 2^(attempt-1) seconds.
    std::chrono::milliseconds DelayAfter(int attempt) const;
};

// Every request goes through one transport so connections are reused.
// Safe for concurrent use as long as the transport is.
class FetchClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr long kDefaultTimeoutMs = 10000;

    FetchClient(std::shared_ptr<IHttpTransport> transport, RetryPolicy policy, Sleeper sleeper = {});

    FetchClient(const FetchClient&) = delete;
    FetchClient& operator=(const FetchClient&) = delete;

    // Throws NetworkError once the retry policy gives up.
    std::string FetchBytes(const std::string& url, const QueryParams& params = {}, long timeout_ms = kDefaultTimeoutMs);
    HtmlDocument FetchDocument(const std::string& url, const QueryParams& params = {}, long timeout_ms = kDefaultTimeoutMs);

    const RetryPolicy& policy() const { return policy_; }

    // Process-wide client built from Config on first use. Shutdown() releases
    // it together with its connection pool; a later Global() builds a new one.
    static FetchClient& Global();
    static void Shutdown();

private:
    std::shared_ptr<IHttpTransport> transport_;
    RetryPolicy policy_;
    Sleeper sleeper_;

    static std::mutex global_mutex_;
    static std::unique_ptr<FetchClient> global_;
};

}

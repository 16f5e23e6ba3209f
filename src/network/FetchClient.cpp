#include "FetchClient.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include "CurlTransport.hpp"
#include "../../config/Config.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Logger.hpp"

namespace MangaHarvest {

std::mutex FetchClient::global_mutex_;
std::unique_ptr<FetchClient> FetchClient::global_;

bool RetryPolicy::IsRetryableStatus(long status) const {
    return std::find(retry_statuses.begin(), retry_statuses.end(), status) != retry_statuses.end();
}

std::chrono::milliseconds RetryPolicy::DelayAfter(int attempt) const {
    double seconds = backoff_factor * std::pow(2.0, std::max(0, attempt - 1));
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

FetchClient::FetchClient(std::shared_ptr<IHttpTransport> transport, RetryPolicy policy, Sleeper sleeper)
    : transport_(std::move(transport)), policy_(std::move(policy)), sleeper_(std::move(sleeper)) {
    if (!transport_) {
        throw std::invalid_argument("FetchClient requires a transport");
    }
    if (policy_.max_attempts < 1) policy_.max_attempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string FetchClient::FetchBytes(const std::string& url, const QueryParams& params, long timeout_ms) {
    const std::string full_url = UrlUtil::WithQuery(url, params);
    long last_status = 0;
    std::string last_error;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
        HttpResponse response = transport_->Get(full_url, timeout_ms);

        if (response.error.empty()) {
            last_status = response.status_code;
            if (response.status_code < 400) {
                return std::move(response.content);
            }
            last_error.clear();
            if (!policy_.IsRetryableStatus(response.status_code)) {
                Logger::Log(LogLevel::Warn, "HTTP " + std::to_string(response.status_code) + " for " + full_url + ", not retrying.");
                throw NetworkError(full_url, attempt, response.status_code, "non-retryable status");
            }
        } else {
            last_status = 0;
            last_error = response.error;
            if (response.permanent) {
                Logger::Log(LogLevel::Warn, "Request to " + full_url + " failed (" + last_error + "), not retrying.");
                throw NetworkError(full_url, attempt, 0, last_error);
            }
        }

        if (attempt < policy_.max_attempts) {
            auto delay = policy_.DelayAfter(attempt);
            Logger::Log(LogLevel::Warn, "Attempt " + std::to_string(attempt) + " for " + full_url + " failed (" +
                        (last_error.empty() ? "HTTP " + std::to_string(last_status) : last_error) +
                        "), retrying in " + std::to_string(delay.count()) + " ms");
            sleeper_(delay);
        }
    }

    Logger::Log(LogLevel::Error, "Giving up on " + full_url + " after " + std::to_string(policy_.max_attempts) + " attempts.");
    throw NetworkError(full_url, policy_.max_attempts, last_status, last_error.empty() ? "retries exhausted" : last_error);
}

HtmlDocument FetchClient::FetchDocument(const std::string& url, const QueryParams& params, long timeout_ms) {
    return HtmlDocument::Parse(FetchBytes(url, params, timeout_ms));
}

FetchClient& FetchClient::Global() {
    std::lock_guard<std::mutex> lock(global_mutex_);
    if (!global_) {
        const auto& cfg = Config::GetInstance();
        CurlTransport::Options transport_options;
        transport_options.user_agent = cfg.http_user_agent;
        transport_options.max_redirects = cfg.http_max_redirects;

        RetryPolicy policy;
        policy.max_attempts = cfg.retry_max_attempts;
        policy.backoff_factor = cfg.retry_backoff_factor;
        policy.retry_statuses = cfg.retry_status_codes;

        global_ = std::make_unique<FetchClient>(std::make_shared<CurlTransport>(transport_options), policy);
        Logger::Log(LogLevel::Debug, "Shared fetch client created.");
    }
    return *global_;
}

void FetchClient::Shutdown() {
    std::lock_guard<std::mutex> lock(global_mutex_);
    if (global_) {
        global_.reset();
        Logger::Log(LogLevel::Debug, "Shared fetch client closed.");
    }
}

}

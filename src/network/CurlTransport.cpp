#include "CurlTransport.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <memory>
#include <stdexcept>
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    size_t max_bytes;
    bool truncated = false;
    char error_buffer[CURL_ERROR_SIZE] = {0};
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    if (ctx->buffer.size() + chunk > ctx->max_bytes) {
        ctx->truncated = true;
        return 0; // Abort: a truncated image or page is useless here
    }

    try {
        ctx->buffer.append(static_cast<char*>(contents), chunk);
    } catch (const std::bad_alloc&) {
        return 0; // Indicates an error
    }
    return chunk;
}

struct EasyHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};
using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;

// Helper to create and configure a cURL easy handle
EasyHandle CreateEasyHandle(const std::string& url, long timeout_ms, const MangaHarvest::CurlTransport::Options& options,
                            CURLSH* share, TransferContext* transfer_ctx) {
    EasyHandle curl(curl_easy_init());
    if (!curl) return nullptr;
    CURL* h = curl.get();

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(h, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, options.max_redirects);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(h, CURLOPT_SHARE, share);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(h, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(h, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    return curl;
}

void LockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* locks = static_cast<MangaHarvest::CurlTransport::ShareLocks*>(userptr);
    (*locks)[static_cast<size_t>(data) % locks->size()].lock();
}

void UnlockShare(CURL*, curl_lock_data data, void* userptr) {
    auto* locks = static_cast<MangaHarvest::CurlTransport::ShareLocks*>(userptr);
    (*locks)[static_cast<size_t>(data) % locks->size()].unlock();
}

} // anonymous namespace

namespace MangaHarvest {

CurlTransport::CurlTransport(Options options) : options_(std::move(options)) {
    share_handle_ = curl_share_init();
    if (!share_handle_) {
        throw std::runtime_error("Failed to initialize cURL share handle");
    }
    curl_share_setopt(share_handle_, CURLSHOPT_LOCKFUNC, LockShare);
    curl_share_setopt(share_handle_, CURLSHOPT_UNLOCKFUNC, UnlockShare);
    curl_share_setopt(share_handle_, CURLSHOPT_USERDATA, &share_locks_);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    Logger::Log(LogLevel::Debug, "cURL transport ready with shared connection pool.");
}

CurlTransport::~CurlTransport() {
    if (share_handle_) {
        curl_share_cleanup(share_handle_);
    }
}

HttpResponse CurlTransport::Get(const std::string& url, long timeout_ms) {
    HttpResponse result;
    TransferContext transfer_ctx{"", options_.max_bytes};

    EasyHandle curl = CreateEasyHandle(url, timeout_ms, options_, share_handle_, &transfer_ctx);
    if (!curl) {
        result.error = "Failed to create cURL easy handle";
        Logger::Log(LogLevel::Error, result.error + " for: " + url);
        return result;
    }

    Logger::Log(LogLevel::Debug, "GET " + url);
    CURLcode code = curl_easy_perform(curl.get());

    if (code == CURLE_OK) {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status_code);
        char* eff_url = nullptr;
        curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &eff_url);
        if (eff_url) result.effective_url = eff_url;
        result.content = std::move(transfer_ctx.buffer);
    } else if (transfer_ctx.truncated) {
        result.error = "response exceeds " + std::to_string(options_.max_bytes) + " bytes";
        result.permanent = true;
    } else {
        result.error = transfer_ctx.error_buffer;
        if (result.error.empty()) {
            result.error = curl_easy_strerror(code);
        }
    }
    return result;
}

}

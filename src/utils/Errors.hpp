#pragma once
#include <stdexcept>
#include <string>

namespace MangaHarvest {

    // Raised when a request could not be completed: retries exhausted,
    // a non-retryable HTTP status, or a connection-level failure.
    class NetworkError : public std::runtime_error {
    public:
        NetworkError(const std::string& url, int attempts, long status, const std::string& detail)
            : std::runtime_error(BuildMessage(url, attempts, status, detail)),
              url_(url), attempts_(attempts), status_(status) {}

        const std::string& url() const { return url_; }
        int attempts() const { return attempts_; }
        long status() const { return status_; } // 0 when no HTTP response was received

    private:
        static std::string BuildMessage(const std::string& url, int attempts, long status, const std::string& detail) {
            std::string msg = "Request to " + url + " failed after " + std::to_string(attempts) +
                              (attempts == 1 ? " attempt" : " attempts");
            if (status != 0) msg += " (HTTP " + std::to_string(status) + ")";
            if (!detail.empty()) msg += ": " + detail;
            return msg;
        }

        std::string url_;
        int attempts_;
        long status_;
    };

    // An image could not be fetched or stored while assembling a chapter.
    class DownloadError : public std::runtime_error {
    public:
        DownloadError(const std::string& url, const std::string& detail)
            : std::runtime_error("Failed to download " + url + ": " + detail), url_(url) {}

        const std::string& url() const { return url_; }

    private:
        std::string url_;
    };

    class AssemblyError : public std::runtime_error {
    public:
        explicit AssemblyError(const std::string& what) : std::runtime_error(what) {}
    };

}

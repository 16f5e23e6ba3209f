#pragma once
#include <string>
#include <vector>
#include <optional>
#include "../network/FetchClient.hpp"
#include "../parser/HtmlDocument.hpp"
#include "../parser/Models.hpp"

namespace MangaHarvest {
    // Reads one manga page. The page is downloaded by the first accessor that
    // needs it and reused by every later one; a failed download is not cached.
    class MangaDetailsScraper {
    public:
        MangaDetailsScraper(FetchClient& client, std::string manga_url, long timeout_ms = FetchClient::kDefaultTimeoutMs);

        const std::string& url() const { return url_; }

        // Fetch-or-return-cached. Throws NetworkError if the page cannot be fetched.
        const HtmlDocument& Page();

        std::string Title();
        std::string Poster();
        std::string Description();
        std::vector<std::string> Genres();
        std::string Status();
        std::string Rate();
        std::vector<ChapterDetailed> Chapters();

        MangaDetails Details();

    private:
        FetchClient& client_;
        std::string url_;
        long timeout_ms_;
        std::optional<HtmlDocument> page_;
    };
}

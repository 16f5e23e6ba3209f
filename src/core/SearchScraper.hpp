#pragma once
#include <string>
#include "../network/FetchClient.hpp"
#include "../parser/Models.hpp"

namespace MangaHarvest {
    // One search results page per call; later pages are fetched only when
    // asked for explicitly.
    class SearchScraper {
    public:
        struct Options {
            std::string base_url = "https://azoramoon.com";
            int results_per_page = 12;
            long timeout_ms = FetchClient::kDefaultTimeoutMs;
        };

        SearchScraper(FetchClient& client, Options options);

        // page is 1-based. Zero matches gives result_no == 0, pages == 0 and no results.
        SearchPage Search(const std::string& query, int page = 1);

        std::string PageUrl(int page) const;

    private:
        FetchClient& client_;
        Options options_;
    };
}

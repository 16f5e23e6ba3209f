#pragma once
#include <set>
#include <string>
#include <vector>
#include "../network/FetchClient.hpp"

namespace MangaHarvest {
    // Walks the site's series index. Pages are fetched by a fixed number of
    // workers so the site never sees more than max_workers requests at once.
    class CatalogWalker {
    public:
        struct Options {
            std::string base_url = "https://azoramoon.com";
            int max_workers = 5;
            int results_per_page = 12;
            long timeout_ms = FetchClient::kDefaultTimeoutMs;
        };

        CatalogWalker(FetchClient& client, Options options);

        // Reads the last page number from the first index page.
        int GetTotalPages();
        // Entry URLs listed on one index page, in page order.
        std::vector<std::string> GetLinks(int page_number);
        // Links from pages [1, pages_to_fetch], deduplicated. A page that fails
        // is logged and skipped; returns once every page has finished.
        std::set<std::string> Start(int pages_to_fetch);
        // Start(GetTotalPages())
        std::set<std::string> Enumerate();

        std::string PageUrl(int page_number) const;

    private:
        FetchClient& client_;
        Options options_;
    };
}

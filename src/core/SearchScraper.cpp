#include "SearchScraper.hpp"
#include <stdexcept>
#include "../parser/MangaParser.hpp"
#include "../utils/Logger.hpp"

namespace MangaHarvest {

SearchScraper::SearchScraper(FetchClient& client, Options options)
    : client_(client), options_(std::move(options)) {
    if (options_.results_per_page < 1) options_.results_per_page = 1;
}

std::string SearchScraper::PageUrl(int page) const {
    if (page <= 1) return options_.base_url + "/";
    return options_.base_url + "/page/" + std::to_string(page) + "/";
}

SearchPage SearchScraper::Search(const std::string& query, int page) {
    if (page < 1) {
        throw std::invalid_argument("Search page must be 1 or greater, got " + std::to_string(page));
    }

    const std::string url = PageUrl(page);
    Logger::Log(LogLevel::Info, "Searching for \"" + query + "\" (page " + std::to_string(page) + ")");
    HtmlDocument doc = client_.FetchDocument(url, {{"s", query}, {"post_type", "wp-manga"}}, options_.timeout_ms);

    SearchPage result;
    result.query = query;
    result.page = page;
    result.result_no = MangaParser::ParseSearchResultCount(doc, url);
    // long long: result_no may be as large as INT_MAX.
    const long long per_page = options_.results_per_page;
    result.pages = static_cast<int>((static_cast<long long>(result.result_no) + per_page - 1) / per_page);
    result.results = MangaParser::ParseSearchResults(doc, url);

    Logger::Log(LogLevel::Debug, "Search \"" + query + "\": " + std::to_string(result.result_no) + " results over " +
                std::to_string(result.pages) + " pages, " + std::to_string(result.results.size()) + " on this page");
    return result;
}

}

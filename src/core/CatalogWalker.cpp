#include "CatalogWalker.hpp"
#include <algorithm>
#include <future>
#include "../parser/MangaParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ThreadPool.hpp"

namespace MangaHarvest {

CatalogWalker::CatalogWalker(FetchClient& client, Options options)
    : client_(client), options_(std::move(options)) {
    if (options_.max_workers < 1) options_.max_workers = 1;
}

std::string CatalogWalker::PageUrl(int page_number) const {
    return options_.base_url + "/series/page/" + std::to_string(page_number) + "/";
}

int CatalogWalker::GetTotalPages() {
    const std::string url = PageUrl(1);
    HtmlDocument doc = client_.FetchDocument(url, {}, options_.timeout_ms);
    int pages = MangaParser::ParseCatalogLastPage(doc, options_.results_per_page, url);
    Logger::Log(LogLevel::Info, "Catalog has " + std::to_string(pages) + " pages");
    return pages;
}

std::vector<std::string> CatalogWalker::GetLinks(int page_number) {
    const std::string url = PageUrl(page_number);
    HtmlDocument doc = client_.FetchDocument(url, {}, options_.timeout_ms);
    return MangaParser::ParseCatalogLinks(doc, url);
}

std::set<std::string> CatalogWalker::Start(int pages_to_fetch) {
    std::set<std::string> links;
    if (pages_to_fetch < 1) return links;

    size_t workers = std::min(static_cast<size_t>(options_.max_workers), static_cast<size_t>(pages_to_fetch));
    Logger::Log(LogLevel::Info, "Fetching " + std::to_string(pages_to_fetch) + " catalog pages with " +
                std::to_string(workers) + " workers");

    std::vector<std::future<std::vector<std::string>>> futures;
    futures.reserve(static_cast<size_t>(pages_to_fetch));
    {
        ThreadPool pool(workers);
        for (int page = 1; page <= pages_to_fetch; ++page) {
            futures.push_back(pool.enqueue([this, page] { return GetLinks(page); }));
        }
    } // join barrier: the pool drains its queue before the threads are joined

    int failed = 0;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            auto page_links = futures[i].get();
            links.insert(page_links.begin(), page_links.end());
        } catch (const std::exception& e) {
            ++failed;
            Logger::Log(LogLevel::Error, "Error fetching catalog page " + std::to_string(i + 1) + ": " + e.what());
        }
    }

    Logger::Log(LogLevel::Info, "Collected " + std::to_string(links.size()) + " unique links from " +
                std::to_string(pages_to_fetch - failed) + "/" + std::to_string(pages_to_fetch) + " pages");
    return links;
}

std::set<std::string> CatalogWalker::Enumerate() {
    return Start(GetTotalPages());
}

}

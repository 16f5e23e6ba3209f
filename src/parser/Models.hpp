#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace MangaHarvest {

    // Every record is built once from one parsed page and never modified.
    // Missing markup leaves a field empty rather than failing the record.

    struct ChapterLatest {
        std::string url;   // empty when the result lists no chapter
        std::string title;
    };

    struct ChapterDetailed {
        int order_no = 0;  // 1-based reading order
        std::string url;
        std::string title;
    };

    struct ChapterImage {
        int order_no = 0;  // 1-based display order
        std::string url;
    };

    struct MangaSearchResult {
        std::string url;
        std::string title;
        std::string poster;
        std::vector<std::string> genres;
        std::string status;
        std::string rate;  // as displayed, not necessarily numeric
        ChapterLatest latest_chapter;
    };

    struct MangaDetails {
        std::string url;
        std::string title;
        std::string poster;
        std::string description;
        std::vector<std::string> genres;
        std::string status;
        std::string rate;
        std::vector<ChapterDetailed> chapters;
    };

    struct SearchPage {
        std::string query;
        int page = 1;
        int result_no = 0;
        int pages = 0;
        std::vector<MangaSearchResult> results;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChapterLatest, url, title)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChapterDetailed, order_no, url, title)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ChapterImage, order_no, url)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MangaSearchResult, url, title, poster, genres, status, rate, latest_chapter)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(MangaDetails, url, title, poster, description, genres, status, rate, chapters)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SearchPage, query, page, result_no, pages, results)

}

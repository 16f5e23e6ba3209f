#pragma once
#include <string>
#include <vector>
#include <optional>
#include "HtmlDocument.hpp"
#include "Models.hpp"

namespace MangaHarvest {
namespace MangaParser {

// Extraction rules for the site's markup. None of these throw on missing
// markup: the field falls back to "" (or an empty list) and a warning is logged.
// `page_url` is used to resolve relative links and to label warnings.

// Leading integer of a text such as "25 results for ...".
std::optional<int> LeadingInteger(const std::string& text);

// Search results page
int ParseSearchResultCount(const HtmlDocument& doc, const std::string& page_url);
MangaSearchResult ParseSearchResult(const HtmlNode& node, const std::string& page_url);
std::vector<MangaSearchResult> ParseSearchResults(const HtmlDocument& doc, const std::string& page_url);

// Manga detail page
std::string ParseTitle(const HtmlDocument& doc, const std::string& page_url);
std::string ParsePoster(const HtmlDocument& doc, const std::string& page_url);
std::string ParseDescription(const HtmlDocument& doc, const std::string& page_url);
std::vector<std::string> ParseGenres(const HtmlDocument& doc, const std::string& page_url);
std::string ParseStatus(const HtmlDocument& doc, const std::string& page_url);
std::string ParseRate(const HtmlDocument& doc, const std::string& page_url);
// Oldest chapter first, numbered from 1.
std::vector<ChapterDetailed> ParseChapters(const HtmlDocument& doc, const std::string& page_url);

// Chapter reader page, numbered from 1 in display order.
std::vector<ChapterImage> ParseChapterImages(const HtmlDocument& doc, const std::string& page_url);

// Catalog index page
std::vector<std::string> ParseCatalogLinks(const HtmlDocument& doc, const std::string& page_url);
// Last page from the pagination control, falling back to the entry count
// and finally to 1.
int ParseCatalogLastPage(const HtmlDocument& doc, int results_per_page, const std::string& page_url);

}
}

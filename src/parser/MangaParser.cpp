#include "MangaParser.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace MangaHarvest {
namespace MangaParser {

namespace {

// Search results
const char* kSearchCount = "h1";
const char* kSearchItem = "div.row.c-tabs-item__content";
const char* kSearchLink = "div.c-image-hover a";
const char* kSearchPoster = "div.c-image-hover a img";
const char* kSearchGenres = "div.mg_genres div.summary-content a";
const char* kSearchStatus = "div.mg_status div.summary-content";
const char* kSearchRate = "span.total_votes";
const char* kSearchLatest = "div.latest-chap a";

// Detail page
const char* kTitle = "div.post-title h1";
const char* kTitleFallback = "h1";
const char* kPoster = "div.summary_image img";
const char* kDescription = "div.manga-summary";
const char* kDescriptionFallback = "div.summary__content";
const char* kGenres = "div.genres-content a";
const char* kStatus = "div.summary-content div.tags-content";
const char* kStatusFallback = "div.post-status div.summary-content";
const char* kRate = "span#averagerate";
const char* kChapterRow = "li.wp-manga-chapter";

// Reader page
const char* kChapterImage = "img.wp-manga-chapter-img";

// Catalog
const char* kCatalogLink = "h3 a";
const char* kPaginationLast = "div.wp-pagenavi a.last";
const char* kPaginationPages = "div.wp-pagenavi a.page, div.wp-pagenavi span.current";
const char* kCatalogCount = "div.h4";

void Warn(const std::string& field, const std::string& page_url) {
    Logger::Log(LogLevel::Warn, "Missing " + field + " on " + page_url + ", using empty value.");
}

std::string TrimCopy(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

// First non-empty text among the selectors, tried in order.
std::optional<std::string> FirstText(const HtmlNode& root, std::initializer_list<const char*> selectors) {
    for (const char* sel : selectors) {
        auto text = root.GetText(sel);
        if (text && !text->empty()) return text;
    }
    return std::nullopt;
}

// Image source, preferring src and falling back to the lazy-load attributes.
std::optional<std::string> ImageSource(const HtmlNode& img) {
    for (const char* attr : {"src", "data-src", "data-lazy-src"}) {
        auto value = img.Attr(attr);
        if (value) {
            std::string trimmed = TrimCopy(*value);
            if (!trimmed.empty()) return trimmed;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<int> LeadingInteger(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;

    long long value = 0;
    for (; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (std::isdigit(c)) {
            value = value * 10 + (c - '0');
            if (value > INT_MAX) return std::nullopt;
        } else if (c != ',') {
            break; // thousands separators are skipped, anything else ends the number
        }
    }
    return static_cast<int>(value);
}

int ParseSearchResultCount(const HtmlDocument& doc, const std::string& page_url) {
    auto text = doc.GetText(kSearchCount);
    if (!text) {
        Warn("result count", page_url);
        return 0;
    }
    auto count = LeadingInteger(*text);
    if (!count) {
        Logger::Log(LogLevel::Warn, "Result count \"" + *text + "\" on " + page_url + " is not numeric, assuming 0.");
        return 0;
    }
    return *count;
}

MangaSearchResult ParseSearchResult(const HtmlNode& node, const std::string& page_url) {
    MangaSearchResult result;

    if (auto link = node.First(kSearchLink)) {
        result.url = UrlUtil::ResolveAgainst(page_url, link->Attr("href").value_or(""));
        result.title = link->Attr("title").value_or("");
        if (result.title.empty()) result.title = link->Text();
    }
    if (result.url.empty()) Warn("search result link", page_url);
    if (result.title.empty()) Warn("search result title", page_url);

    if (auto img = node.First(kSearchPoster)) {
        result.poster = UrlUtil::ResolveAgainst(page_url, ImageSource(*img).value_or(""));
    }
    if (result.poster.empty()) Warn("poster of " + result.url, page_url);

    for (const auto& genre : node.Select(kSearchGenres)) {
        std::string text = genre.Text();
        if (!text.empty()) result.genres.push_back(std::move(text));
    }
    if (result.genres.empty()) Warn("genres of " + result.url, page_url);

    result.status = node.GetText(kSearchStatus).value_or("");
    if (result.status.empty()) Warn("status of " + result.url, page_url);

    result.rate = node.GetText(kSearchRate).value_or("");
    if (result.rate.empty()) Warn("rating of " + result.url, page_url);

    if (auto latest = node.First(kSearchLatest)) {
        result.latest_chapter.url = UrlUtil::ResolveAgainst(page_url, latest->Attr("href").value_or(""));
        result.latest_chapter.title = latest->Text();
    } else {
        Warn("latest chapter of " + result.url, page_url);
    }
    return result;
}

std::vector<MangaSearchResult> ParseSearchResults(const HtmlDocument& doc, const std::string& page_url) {
    std::vector<MangaSearchResult> results;
    for (const auto& node : doc.Select(kSearchItem)) {
        results.push_back(ParseSearchResult(node, page_url));
    }
    return results;
}

std::string ParseTitle(const HtmlDocument& doc, const std::string& page_url) {
    auto title = FirstText(doc.Root(), {kTitle, kTitleFallback});
    if (!title) Warn("title", page_url);
    return title.value_or("");
}

std::string ParsePoster(const HtmlDocument& doc, const std::string& page_url) {
    if (auto img = doc.First(kPoster)) {
        if (auto src = ImageSource(*img)) return UrlUtil::ResolveAgainst(page_url, *src);
    }
    Warn("poster", page_url);
    return "";
}

std::string ParseDescription(const HtmlDocument& doc, const std::string& page_url) {
    auto description = FirstText(doc.Root(), {kDescription, kDescriptionFallback});
    if (!description) Warn("description", page_url);
    return description.value_or("");
}

std::vector<std::string> ParseGenres(const HtmlDocument& doc, const std::string& page_url) {
    std::vector<std::string> genres;
    for (const auto& node : doc.Select(kGenres)) {
        std::string text = node.Text();
        if (!text.empty()) genres.push_back(std::move(text));
    }
    if (genres.empty()) Warn("genres", page_url);
    return genres;
}

std::string ParseStatus(const HtmlDocument& doc, const std::string& page_url) {
    auto status = FirstText(doc.Root(), {kStatus, kStatusFallback});
    if (!status) Warn("status", page_url);
    return status.value_or("");
}

std::string ParseRate(const HtmlDocument& doc, const std::string& page_url) {
    auto rate = FirstText(doc.Root(), {kRate});
    if (!rate) Warn("rating", page_url);
    return rate.value_or("");
}

std::vector<ChapterDetailed> ParseChapters(const HtmlDocument& doc, const std::string& page_url) {
    auto rows = doc.Select(kChapterRow);
    // The site lists the newest chapter first.
    std::reverse(rows.begin(), rows.end());

    std::vector<ChapterDetailed> chapters;
    chapters.reserve(rows.size());
    for (const auto& row : rows) {
        auto link = row.First("a");
        std::optional<std::string> href;
        if (link) href = link->Attr("href");
        if (!href || TrimCopy(*href).empty()) {
            Logger::Log(LogLevel::Warn, "Skipping chapter row without link on " + page_url);
            continue;
        }
        ChapterDetailed chapter;
        chapter.order_no = static_cast<int>(chapters.size()) + 1;
        chapter.url = UrlUtil::ResolveAgainst(page_url, TrimCopy(*href));
        chapter.title = link->Text();
        chapters.push_back(std::move(chapter));
    }
    return chapters;
}

std::vector<ChapterImage> ParseChapterImages(const HtmlDocument& doc, const std::string& page_url) {
    std::vector<ChapterImage> images;
    for (const auto& node : doc.Select(kChapterImage)) {
        auto src = ImageSource(node);
        if (!src) {
            Logger::Log(LogLevel::Warn, "Skipping chapter image without source on " + page_url);
            continue;
        }
        images.push_back({static_cast<int>(images.size()) + 1, UrlUtil::ResolveAgainst(page_url, *src)});
    }
    return images;
}

std::vector<std::string> ParseCatalogLinks(const HtmlDocument& doc, const std::string& page_url) {
    std::vector<std::string> links;
    for (const auto& node : doc.Select(kCatalogLink)) {
        auto href = node.Attr("href");
        if (!href || href->empty()) {
            Warn("catalog entry link", page_url);
            continue;
        }
        links.push_back(UrlUtil::ResolveAgainst(page_url, *href));
    }
    return links;
}

int ParseCatalogLastPage(const HtmlDocument& doc, int results_per_page, const std::string& page_url) {
    if (auto href = doc.GetAttr(kPaginationLast, "href")) {
        if (auto page = UrlUtil::PageNumberFromUrl(*href)) return *page;
    }

    int highest = 0;
    for (const auto& node : doc.Select(kPaginationPages)) {
        if (auto n = LeadingInteger(node.Text())) highest = std::max(highest, *n);
    }
    if (highest > 0) return highest;

    if (auto text = doc.GetText(kCatalogCount)) {
        if (auto count = LeadingInteger(*text)) {
            const long long per_page = std::max(1, results_per_page);
            return std::max(1, static_cast<int>((static_cast<long long>(*count) + per_page - 1) / per_page));
        }
    }

    Logger::Log(LogLevel::Warn, "No pagination found on " + page_url + ", assuming a single page.");
    return 1;
}

}
}

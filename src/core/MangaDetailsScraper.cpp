#include "MangaDetailsScraper.hpp"
#include "../parser/MangaParser.hpp"
#include "../utils/Logger.hpp"

namespace MangaHarvest {

MangaDetailsScraper::MangaDetailsScraper(FetchClient& client, std::string manga_url, long timeout_ms)
    : client_(client), url_(std::move(manga_url)), timeout_ms_(timeout_ms) {}

const HtmlDocument& MangaDetailsScraper::Page() {
    if (!page_) {
        Logger::Log(LogLevel::Debug, "Fetching manga page: " + url_);
        page_ = client_.FetchDocument(url_, {}, timeout_ms_);
    }
    return *page_;
}

std::string MangaDetailsScraper::Title() { return MangaParser::ParseTitle(Page(), url_); }

std::string MangaDetailsScraper::Poster() { return MangaParser::ParsePoster(Page(), url_); }

std::string MangaDetailsScraper::Description() { return MangaParser::ParseDescription(Page(), url_); }

std::vector<std::string> MangaDetailsScraper::Genres() { return MangaParser::ParseGenres(Page(), url_); }

std::string MangaDetailsScraper::Status() { return MangaParser::ParseStatus(Page(), url_); }

std::string MangaDetailsScraper::Rate() { return MangaParser::ParseRate(Page(), url_); }

std::vector<ChapterDetailed> MangaDetailsScraper::Chapters() { return MangaParser::ParseChapters(Page(), url_); }

MangaDetails MangaDetailsScraper::Details() {
    MangaDetails details;
    details.url = url_;
    details.title = Title();
    details.poster = Poster();
    details.description = Description();
    details.genres = Genres();
    details.status = Status();
    details.rate = Rate();
    details.chapters = Chapters();
    Logger::Log(LogLevel::Info, "Read \"" + details.title + "\" with " + std::to_string(details.chapters.size()) + " chapters");
    return details;
}

}

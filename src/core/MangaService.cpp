#include "MangaService.hpp"
#include "CatalogWalker.hpp"
#include "ChapterImagesScraper.hpp"
#include "MangaDetailsScraper.hpp"
#include "SearchScraper.hpp"
#include "../../config/Config.hpp"

namespace MangaHarvest {

MangaService::Options MangaService::Options::FromConfig(const Config& config) {
    Options options;
    options.base_url = config.base_url;
    options.results_per_page = config.results_per_page;
    options.http_timeout_ms = config.http_timeout_ms;
    options.image_timeout_ms = config.image_timeout_ms;
    options.catalog_max_workers = config.catalog_max_workers;
    options.image_download_workers = config.image_download_workers;
    options.temp_dir = config.temp_dir;
    return options;
}

MangaService::MangaService(FetchClient& client, IDocumentAssembler& assembler, Options options)
    : client_(client), assembler_(assembler), options_(std::move(options)) {}

SearchPage MangaService::Search(const std::string& query, int page) {
    SearchScraper scraper(client_, {options_.base_url, options_.results_per_page, options_.http_timeout_ms});
    return scraper.Search(query, page);
}

MangaDetails MangaService::GetDetails(const std::string& manga_url) {
    MangaDetailsScraper scraper(client_, manga_url, options_.http_timeout_ms);
    return scraper.Details();
}

std::vector<ChapterImage> MangaService::GetChapterImages(const std::string& chapter_url) {
    ChapterImagesScraper scraper(client_, assembler_, chapter_url,
                                 {options_.http_timeout_ms, options_.image_timeout_ms, options_.image_download_workers, options_.temp_dir});
    return scraper.Images();
}

void MangaService::DownloadChapterAsDocument(const std::string& chapter_url, const std::filesystem::path& output_path) {
    ChapterImagesScraper scraper(client_, assembler_, chapter_url,
                                 {options_.http_timeout_ms, options_.image_timeout_ms, options_.image_download_workers, options_.temp_dir});
    scraper.AssembleDocument(output_path);
}

std::set<std::string> MangaService::EnumerateCatalog(int pages_to_fetch) {
    CatalogWalker walker(client_, {options_.base_url, options_.catalog_max_workers, options_.results_per_page, options_.http_timeout_ms});
    if (pages_to_fetch > 0) return walker.Start(pages_to_fetch);
    return walker.Enumerate();
}

}

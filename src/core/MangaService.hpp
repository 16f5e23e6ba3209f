#pragma once
#include <filesystem>
#include <set>
#include <string>
#include <vector>
#include "../network/FetchClient.hpp"
#include "../interfaces/IDocumentAssembler.hpp"
#include "../parser/Models.hpp"

namespace MangaHarvest {
    struct Config;

    // Entry points used by the command line. Each call builds the scraper it
    // needs around the shared client; nothing is cached between calls.
    class MangaService {
    public:
        struct Options {
            std::string base_url = "https://azoramoon.com";
            int results_per_page = 12;
            long http_timeout_ms = FetchClient::kDefaultTimeoutMs;
            long image_timeout_ms = 15000;
            int catalog_max_workers = 5;
            int image_download_workers = 6;
            std::filesystem::path temp_dir;

            static Options FromConfig(const Config& config);
        };

        MangaService(FetchClient& client, IDocumentAssembler& assembler, Options options);

        SearchPage Search(const std::string& query, int page = 1);
        MangaDetails GetDetails(const std::string& manga_url);
        std::vector<ChapterImage> GetChapterImages(const std::string& chapter_url);
        void DownloadChapterAsDocument(const std::string& chapter_url, const std::filesystem::path& output_path);
        std::set<std::string> EnumerateCatalog(int pages_to_fetch = 0); // 0: every page

    private:
        FetchClient& client_;
        IDocumentAssembler& assembler_;
        Options options_;
    };
}

#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "../network/FetchClient.hpp"
#include "../interfaces/IDocumentAssembler.hpp"
#include "../parser/Models.hpp"

namespace MangaHarvest {
    class ChapterImagesScraper {
    public:
        struct Options {
            long timeout_ms = FetchClient::kDefaultTimeoutMs;
            long image_timeout_ms = 15000;
            int download_workers = 6;
            std::filesystem::path temp_root; // empty: system temp directory
        };

        ChapterImagesScraper(FetchClient& client, IDocumentAssembler& assembler, std::string chapter_url, Options options);

        const std::string& url() const { return url_; }

        // Image list of the chapter, fetched on first call and reused afterwards.
        const std::vector<ChapterImage>& Images();

        // Downloads every image into a private temp directory and assembles them,
        // in order, into output_path. The temp directory is gone when this returns,
        // whether it succeeds or throws.
        // Throws AssemblyError for a chapter without images or a rejected assembly,
        // DownloadError naming the image that could not be fetched, and NetworkError
        // if the chapter page itself cannot be fetched.
        void AssembleDocument(const std::filesystem::path& output_path);

    private:
        std::vector<std::filesystem::path> DownloadAll(const std::vector<ChapterImage>& images, const std::filesystem::path& dir);
        std::filesystem::path DownloadOne(const ChapterImage& image, const std::filesystem::path& dir);

        FetchClient& client_;
        IDocumentAssembler& assembler_;
        std::string url_;
        Options options_;
        std::optional<std::vector<ChapterImage>> images_;
    };
}

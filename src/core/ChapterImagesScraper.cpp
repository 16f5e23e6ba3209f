#include "ChapterImagesScraper.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <exception>
#include <fstream>
#include <future>
#include "../parser/MangaParser.hpp"
#include "../utils/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/ScopedTempDir.hpp"
#include "../utils/ThreadPool.hpp"
#include "../utils/UrlUtil.hpp"

namespace MangaHarvest {

namespace {

// page_0001.jpg, page_0002.png, ... so that names sort in reading order.
std::string LocalName(const ChapterImage& image) {
    std::string ext = UrlUtil::GetExtension(image.url);
    bool usable = !ext.empty() && ext.size() <= 5 &&
                  std::all_of(ext.begin(), ext.end(), [](unsigned char c) { return std::isalnum(c); });
    char name[32];
    std::snprintf(name, sizeof(name), "page_%04d.", image.order_no);
    return std::string(name) + (usable ? ext : "img");
}

} // anonymous namespace

ChapterImagesScraper::ChapterImagesScraper(FetchClient& client, IDocumentAssembler& assembler, std::string chapter_url, Options options)
    : client_(client), assembler_(assembler), url_(std::move(chapter_url)), options_(std::move(options)) {}

const std::vector<ChapterImage>& ChapterImagesScraper::Images() {
    if (!images_) {
        Logger::Log(LogLevel::Debug, "Extracting images for " + url_);
        HtmlDocument doc = client_.FetchDocument(url_, {}, options_.timeout_ms);
        images_ = MangaParser::ParseChapterImages(doc, url_);
    }
    return *images_;
}

void ChapterImagesScraper::AssembleDocument(const std::filesystem::path& output_path) {
    const auto& images = Images();
    if (images.empty()) {
        throw AssemblyError("Chapter " + url_ + " has no images, not writing " + output_path.string());
    }

    ScopedTempDir temp_dir(options_.temp_root, "chapter-");
    std::vector<std::filesystem::path> files = DownloadAll(images, temp_dir.path());

    Logger::Log(LogLevel::Info, "Converting " + std::to_string(files.size()) + " images to " + output_path.string());
    assembler_.Assemble(files, output_path);
}

std::vector<std::filesystem::path> ChapterImagesScraper::DownloadAll(const std::vector<ChapterImage>& images,
                                                                     const std::filesystem::path& dir) {
    size_t workers = std::min(images.size(), static_cast<size_t>(std::max(1, options_.download_workers)));
    std::vector<std::future<std::filesystem::path>> futures;
    futures.reserve(images.size());
    {
        ThreadPool pool(workers);
        for (const auto& image : images) {
            futures.push_back(pool.enqueue([this, &image, &dir] { return DownloadOne(image, dir); }));
        }
        // Pool destructor: every dispatched download has finished before dir can go away.
    }

    std::vector<std::filesystem::path> files;
    files.reserve(futures.size());
    std::exception_ptr first_error;
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            files.push_back(futures[i].get());
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Failed to download " + images[i].url + ": " + e.what());
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
    return files;
}

std::filesystem::path ChapterImagesScraper::DownloadOne(const ChapterImage& image, const std::filesystem::path& dir) {
    std::string bytes;
    try {
        bytes = client_.FetchBytes(image.url, {}, options_.image_timeout_ms);
    } catch (const NetworkError& e) {
        throw DownloadError(image.url, e.what());
    }

    std::filesystem::path file = dir / LocalName(image);
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw DownloadError(image.url, "cannot create " + file.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        throw DownloadError(image.url, "cannot write " + file.string());
    }
    Logger::Log(LogLevel::Debug, "Downloaded " + image.url + " (" + std::to_string(bytes.size()) + " bytes)");
    return file;
}

}

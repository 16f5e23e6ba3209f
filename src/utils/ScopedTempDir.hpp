#pragma once
#include <filesystem>
#include <string>

namespace MangaHarvest {

    // Creates a uniquely named directory on construction and removes it,
    // with everything inside, on destruction.
    class ScopedTempDir {
    public:
        // An empty root means std::filesystem::temp_directory_path().
        explicit ScopedTempDir(const std::filesystem::path& root = {}, const std::string& prefix = "mangaharvest-");
        ~ScopedTempDir();

        ScopedTempDir(const ScopedTempDir&) = delete;
        ScopedTempDir& operator=(const ScopedTempDir&) = delete;

        const std::filesystem::path& path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

}

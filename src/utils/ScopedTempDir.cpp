#include "ScopedTempDir.hpp"
#include "Logger.hpp"
#include <random>
#include <stdexcept>

namespace MangaHarvest {

namespace {

std::string RandomSuffix() {
    static const char* alphabet = "abcdefghijklmnopqrstuvwxyz0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    std::string out(12, '0');
    for (auto& c : out) c = alphabet[pick(rng)];
    return out;
}

} // anonymous namespace

ScopedTempDir::ScopedTempDir(const std::filesystem::path& root, const std::string& prefix) {
    std::filesystem::path base = root.empty() ? std::filesystem::temp_directory_path() : root;
    std::filesystem::create_directories(base);

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::filesystem::path candidate = base / (prefix + RandomSuffix());
        std::error_code ec;
        // create_directory returns false when the name is already taken.
        if (std::filesystem::create_directory(candidate, ec)) {
            path_ = candidate;
            Logger::Log(LogLevel::Debug, "Created temp directory: " + path_.string());
            return;
        }
        if (ec) {
            throw std::runtime_error("Could not create temp directory in " + base.string() + ": " + ec.message());
        }
    }
    throw std::runtime_error("Could not find a free temp directory name in " + base.string());
}

ScopedTempDir::~ScopedTempDir() {
    if (path_.empty()) return;
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        Logger::Log(LogLevel::Error, "Failed to remove temp directory " + path_.string() + ": " + ec.message());
    } else {
        Logger::Log(LogLevel::Debug, "Removed temp directory: " + path_.string());
    }
}

}

#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "../config/Config.hpp"
#include "assembler/PdfAssembler.hpp"
#include "core/MangaService.hpp"
#include "network/FetchClient.hpp"
#include "utils/Logger.hpp"

namespace {

void PrintUsage(const char* exe) {
    std::cerr << "Usage:\n"
              << "  " << exe << " search <query> [page]\n"
              << "  " << exe << " details <manga-url>\n"
              << "  " << exe << " images <chapter-url>\n"
              << "  " << exe << " pdf <chapter-url> <output.pdf>\n"
              << "  " << exe << " catalog [pages]\n";
}

bool ParsePositive(const std::string& s, int& out) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size() || v < 1) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns the process exit code.
int RunCommand(MangaHarvest::MangaService& service, const std::string& command, int argc, char* argv[]) {
    if (command == "search" && (argc == 3 || argc == 4)) {
        int page = 1;
        if (argc == 4 && !ParsePositive(argv[3], page)) return 2;
        std::cout << nlohmann::json(service.Search(argv[2], page)).dump(2) << std::endl;
        return 0;
    }
    if (command == "details" && argc == 3) {
        std::cout << nlohmann::json(service.GetDetails(argv[2])).dump(2) << std::endl;
        return 0;
    }
    if (command == "images" && argc == 3) {
        std::cout << nlohmann::json(service.GetChapterImages(argv[2])).dump(2) << std::endl;
        return 0;
    }
    if (command == "pdf" && argc == 4) {
        service.DownloadChapterAsDocument(argv[2], argv[3]);
        std::cout << nlohmann::json{{"output", argv[3]}}.dump(2) << std::endl;
        return 0;
    }
    if (command == "catalog" && (argc == 2 || argc == 3)) {
        int pages = 0;
        if (argc == 3 && !ParsePositive(argv[2], pages)) return 2;
        std::cout << nlohmann::json(service.EnumerateCatalog(pages)).dump(2) << std::endl;
        return 0;
    }
    return 2;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    if (argc < 2) {
        PrintUsage(argv[0]);
        return 2;
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    // Load Config
    try {
        MangaHarvest::Config::GetInstance().Load(config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") == std::string::npos) {
            MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
        MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
        try {
            MangaHarvest::Config::GetInstance().CreateDefault(config_path_str);
        } catch (const std::exception& create_e) {
            MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Warn, "Failed to create default config, continuing with defaults: " + std::string(create_e.what()));
        }
    } catch (const std::exception& e) {
        MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Error, "Failed to load config: " + std::string(e.what()));
        return 1;
    }
    const auto& config = MangaHarvest::Config::GetInstance();
    MangaHarvest::Logger::Init(exe_dir.string(), MangaHarvest::Logger::FromString(config.log_level));

    // Initialize global resources
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Error, "curl_global_init failed.");
        return 1;
    }

    int exit_code = 1;
    try {
        MangaHarvest::PdfAssembler assembler;
        MangaHarvest::MangaService service(MangaHarvest::FetchClient::Global(), assembler,
                                           MangaHarvest::MangaService::Options::FromConfig(config));
        exit_code = RunCommand(service, argv[1], argc, argv);
        if (exit_code == 2) PrintUsage(argv[0]);
    } catch (const std::exception& e) {
        MangaHarvest::Logger::Log(MangaHarvest::LogLevel::Error, e.what());
        exit_code = 1;
    }

    // Cleanup global resources
    MangaHarvest::FetchClient::Shutdown();
    curl_global_cleanup();
    return exit_code;
}

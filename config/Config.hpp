#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace MangaHarvest {
    struct Config {
        std::string base_url = "https://azoramoon.com";
        long http_timeout_ms = 10000;
        long image_timeout_ms = 15000;
        long http_max_redirects = 5;
        std::string http_user_agent = "mangaha-api/1.0 (+https://example.com)";
        int retry_max_attempts = 3;
        double retry_backoff_factor = 0.3; // delay = factor * 2^(attempt-1) seconds
        std::vector<long> retry_status_codes = {500, 502, 504};
        int catalog_max_workers = 5;
        int image_download_workers = 6;
        int results_per_page = 12;
        std::string temp_dir; // empty: system temp directory
        std::string log_level = "info";

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}

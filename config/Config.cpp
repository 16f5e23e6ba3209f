#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace MangaHarvest {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    // Values are read into a copy so a bad file leaves the current settings untouched.
    nlohmann::json data;
    Config loaded;
    try {
        data = nlohmann::json::parse(f);
        if (!data.is_object()) {
            throw std::runtime_error("Config file " + path + " must contain a JSON object");
        }
        const Config defaults;

        loaded.base_url = data.value("base_url", defaults.base_url);
        while (!loaded.base_url.empty() && loaded.base_url.back() == '/') loaded.base_url.pop_back();
        loaded.http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
        loaded.image_timeout_ms = data.value("image_timeout_ms", defaults.image_timeout_ms);
        loaded.http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
        loaded.http_user_agent = data.value("http_user_agent", defaults.http_user_agent);
        loaded.retry_max_attempts = data.value("retry_max_attempts", defaults.retry_max_attempts);
        loaded.retry_backoff_factor = data.value("retry_backoff_factor", defaults.retry_backoff_factor);
        loaded.catalog_max_workers = data.value("catalog_max_workers", defaults.catalog_max_workers);
        loaded.image_download_workers = data.value("image_download_workers", defaults.image_download_workers);
        loaded.results_per_page = data.value("results_per_page", defaults.results_per_page);
        loaded.temp_dir = data.value("temp_dir", defaults.temp_dir);
        loaded.log_level = data.value("log_level", defaults.log_level);

        if (data.contains("retry_status_codes") && data["retry_status_codes"].is_array()) {
            loaded.retry_status_codes.clear();
            for (const auto& v : data["retry_status_codes"]) {
                if (v.is_number_integer()) loaded.retry_status_codes.push_back(v.get<long>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid config file " + path + ": " + e.what());
    }

    if (loaded.retry_max_attempts < 1) {
        throw std::runtime_error("retry_max_attempts must be at least 1 in " + path);
    }
    if (loaded.catalog_max_workers < 1 || loaded.image_download_workers < 1) {
        throw std::runtime_error("Worker counts must be at least 1 in " + path);
    }
    if (loaded.results_per_page < 1) {
        throw std::runtime_error("results_per_page must be at least 1 in " + path);
    }
    *this = loaded;

    // Write back missing keys so existing config.json reflects newly added options.
    // This is non-destructive: preserves unknown keys and only appends missing ones.
    bool changed = false;
    for (const auto& item : ToJson().items()) {
        if (!data.contains(item.key())) {
            data[item.key()] = item.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up " + path + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            Logger::Log(LogLevel::Warn, "Could not write new config keys to " + path);
        }
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["base_url"] = base_url;
    data["http_timeout_ms"] = http_timeout_ms;
    data["image_timeout_ms"] = image_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["http_user_agent"] = http_user_agent;
    data["retry_max_attempts"] = retry_max_attempts;
    data["retry_backoff_factor"] = retry_backoff_factor;
    data["retry_status_codes"] = retry_status_codes;
    data["catalog_max_workers"] = catalog_max_workers;
    data["image_download_workers"] = image_download_workers;
    data["results_per_page"] = results_per_page;
    data["temp_dir"] = temp_dir;
    data["log_level"] = log_level;
    return data;
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << Config().ToJson() << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}

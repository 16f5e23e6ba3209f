#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include "FakeTransport.hpp"
#include "config/Config.hpp"
#include "core/MangaService.hpp"
#include "utils/ScopedTempDir.hpp"

using namespace MangaHarvest;
using MangaHarvest::Testing::FakeTransport;
using MangaHarvest::Testing::LoadFixture;

namespace {
class NullAssembler : public IDocumentAssembler {
public:
    void Assemble(const std::vector<std::filesystem::path>&, const std::filesystem::path&) override { ++calls; }
    int calls = 0;
};
}

TEST_CASE("Config fills missing keys and writes them back") {
    ScopedTempDir dir;
    const auto path = dir.path() / "config.json";
    std::ofstream(path) << R"({"base_url": "https://mirror.example.org/", "catalog_max_workers": 2, "extra": true})";

    Config config;
    config.Load(path.string());
    CHECK(config.base_url == "https://mirror.example.org");
    CHECK(config.catalog_max_workers == 2);
    CHECK(config.retry_max_attempts == 3);
    CHECK(config.retry_status_codes == std::vector<long>{500, 502, 504});

    std::ifstream in(path);
    nlohmann::json written = nlohmann::json::parse(in);
    CHECK(written["extra"] == true);
    CHECK(written["image_download_workers"] == 6);
    CHECK(std::filesystem::exists(dir.path() / "config.json.bak"));
}

TEST_CASE("Config rejects unusable values") {
    ScopedTempDir dir;
    const auto path = dir.path() / "config.json";
    std::ofstream(path) << R"({"retry_max_attempts": 0})";

    Config config;
    CHECK_THROWS_AS(config.Load(path.string()), std::runtime_error);
    CHECK_THROWS_AS(config.Load((dir.path() / "missing.json").string()), std::runtime_error);
}

TEST_CASE("Config default file round-trips through Load") {
    ScopedTempDir dir;
    const auto path = dir.path() / "nested" / "config.json";
    Config().CreateDefault(path.string());

    Config config;
    config.Load(path.string());
    CHECK(config.ToJson() == Config().ToJson());
    CHECK_FALSE(std::filesystem::exists(dir.path() / "nested" / "config.json.bak"));
}

TEST_CASE("MangaService routes calls through the configured site") {
    Config config;
    config.base_url = "https://azoramoon.com";
    config.catalog_max_workers = 2;
    MangaService::Options options = MangaService::Options::FromConfig(config);
    CHECK(options.catalog_max_workers == 2);
    CHECK(options.image_download_workers == 6);

    auto transport = std::make_shared<FakeTransport>();
    transport->Serve("https://azoramoon.com/?s=tower&post_type=wp-manga", LoadFixture("search_results.html"));
    transport->Serve("https://azoramoon.com/series/page/1/", LoadFixture("catalog_page1.html"));
    transport->Serve("https://azoramoon.com/series/page/2/", LoadFixture("catalog_page2.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    NullAssembler assembler;
    MangaService service(client, assembler, options);

    CHECK(service.Search("tower").result_no == 25);
    CHECK(service.EnumerateCatalog(2).size() == 4);
    CHECK(transport->Calls("https://azoramoon.com/series/page/3/") == 0);
}

TEST_CASE("Config reports malformed JSON as a runtime_error and keeps its settings") {
    ScopedTempDir dir;
    const auto path = dir.path() / "config.json";

    Config config;
    config.catalog_max_workers = 4;

    SECTION("truncated file") {
        std::ofstream(path) << R"({"http_timeout_ms": "10s")";
        CHECK_THROWS_AS(config.Load(path.string()), std::runtime_error);
    }
    SECTION("wrong value type") {
        std::ofstream(path) << R"({"http_timeout_ms": "10s", "catalog_max_workers": 9})";
        CHECK_THROWS_WITH(config.Load(path.string()), Catch::Matchers::ContainsSubstring("Invalid config file"));
    }
    SECTION("not an object") {
        std::ofstream(path) << "[1, 2, 3]";
        CHECK_THROWS_AS(config.Load(path.string()), std::runtime_error);
    }
    CHECK(config.catalog_max_workers == 4);
}

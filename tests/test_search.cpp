#include <catch2/catch_all.hpp>
#include <iostream>
#include <memory>
#include <sstream>
#include "FakeTransport.hpp"
#include "core/SearchScraper.hpp"
#include "utils/Errors.hpp"

using namespace MangaHarvest;
using MangaHarvest::Testing::FakeTransport;
using MangaHarvest::Testing::LoadFixture;

namespace {
const std::string kFirstPage = "https://azoramoon.com/?s=tower&post_type=wp-manga";
const std::string kSecondPage = "https://azoramoon.com/page/2/?s=tower&post_type=wp-manga";
}

TEST_CASE("SearchScraper reads counts and complete result records") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, LoadFixture("search_results.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    SearchPage page = scraper.Search("tower");
    CHECK(page.query == "tower");
    CHECK(page.page == 1);
    CHECK(page.result_no == 25);
    CHECK(page.pages == 3);
    REQUIRE(page.results.size() == 2);

    const auto& first = page.results[0];
    CHECK(first.url == "https://azoramoon.com/series/tower-of-ash/");
    CHECK(first.title == "Tower of Ash");
    CHECK(first.poster == "https://azoramoon.com/wp-content/uploads/tower-of-ash-193x278.jpg");
    CHECK(first.genres == std::vector<std::string>{"Action", "Fantasy"});
    CHECK(first.status == "OnGoing");
    CHECK(first.rate == "4.8");
    CHECK(first.latest_chapter.url == "https://azoramoon.com/series/tower-of-ash/chapter-5/");
    CHECK(first.latest_chapter.title == "Chapter 5");
}

TEST_CASE("SearchScraper fills missing sub-elements with empty values") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, LoadFixture("search_results.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    SearchPage page = scraper.Search("tower");
    REQUIRE(page.results.size() == 2);
    const auto& sparse = page.results[1];
    CHECK(sparse.url == "https://azoramoon.com/series/tower-gate/");
    CHECK(sparse.title == "Tower Gate");
    CHECK(sparse.poster == "https://azoramoon.com/wp-content/uploads/tower-gate.webp");
    CHECK(sparse.genres.empty());
    CHECK(sparse.status.empty());
    CHECK(sparse.rate.empty());
    CHECK(sparse.latest_chapter.url.empty());
    CHECK(sparse.latest_chapter.title.empty());
}

TEST_CASE("SearchScraper reports zero matches as zero pages, not an error") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve("https://azoramoon.com/?s=zzzz&post_type=wp-manga", LoadFixture("search_empty.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    SearchPage page = scraper.Search("zzzz");
    CHECK(page.result_no == 0);
    CHECK(page.pages == 0);
    CHECK(page.results.empty());
}

TEST_CASE("SearchScraper fetches later pages only when asked") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, LoadFixture("search_results.html"));
    transport->Serve(kSecondPage, LoadFixture("search_results.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    scraper.Search("tower");
    CHECK(transport->Requests() == std::vector<std::string>{kFirstPage});

    SearchPage second = scraper.Search("tower", 2);
    CHECK(second.page == 2);
    CHECK(transport->Calls(kSecondPage) == 1);
    CHECK_THROWS_AS(scraper.Search("tower", 0), std::invalid_argument);
}

TEST_CASE("SearchScraper treats a page without a count as empty") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, "<html><body><p>Maintenance</p></body></html>");
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    SearchPage page = scraper.Search("tower");
    CHECK(page.result_no == 0);
    CHECK(page.pages == 0);
    CHECK(page.results.empty());
}

TEST_CASE("SearchScraper surfaces network failures") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Fail(kFirstPage);
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    CHECK_THROWS_AS(scraper.Search("tower"), NetworkError);
}

TEST_CASE("SearchScraper page count survives the largest representable result count") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, "<html><body><h1>2147483647 results for \"tower\"</h1></body></html>");
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    SearchPage page = scraper.Search("tower");
    CHECK(page.result_no == 2147483647);
    CHECK(page.pages == 178956971);
}

TEST_CASE("SearchScraper warns about a result without genres") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kFirstPage, LoadFixture("search_results.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    SearchScraper scraper(client, {});

    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    SearchPage page = scraper.Search("tower");
    std::cerr.rdbuf(old);

    REQUIRE(page.results.size() == 2);
    CHECK_THAT(captured.str(), Catch::Matchers::ContainsSubstring(
        "Missing genres of https://azoramoon.com/series/tower-gate/"));
    CHECK(captured.str().find("Missing genres of https://azoramoon.com/series/tower-of-ash/") == std::string::npos);
}

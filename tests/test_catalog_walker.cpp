#include <catch2/catch_all.hpp>
#include <memory>
#include "FakeTransport.hpp"
#include "core/CatalogWalker.hpp"
#include "utils/Errors.hpp"

using namespace MangaHarvest;
using MangaHarvest::Testing::FakeTransport;
using MangaHarvest::Testing::LoadFixture;

namespace {
std::string Page(int n) {
    return "https://azoramoon.com/series/page/" + std::to_string(n) + "/";
}

void ServeCatalog(FakeTransport& transport) {
    transport.Serve(Page(1), LoadFixture("catalog_page1.html"));
    transport.Serve(Page(2), LoadFixture("catalog_page2.html"));
    transport.Serve(Page(3), LoadFixture("catalog_page3.html"));
}
}

TEST_CASE("CatalogWalker reads the page count from the pagination control") {
    auto transport = std::make_shared<FakeTransport>();
    ServeCatalog(*transport);
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK(walker.GetTotalPages() == 3);
    CHECK(transport->Requests() == std::vector<std::string>{Page(1)});
}

TEST_CASE("CatalogWalker falls back to the result count without pagination") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(Page(1), LoadFixture("catalog_no_pagination.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK(walker.GetTotalPages() == 3);
}

TEST_CASE("CatalogWalker lists the links of one page in page order") {
    auto transport = std::make_shared<FakeTransport>();
    ServeCatalog(*transport);
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK(walker.GetLinks(1) == std::vector<std::string>{
        "https://azoramoon.com/series/tower-of-ash/",
        "https://azoramoon.com/series/tower-gate/",
        "https://azoramoon.com/series/red-lantern/"});
    // Relative links are resolved, links without a target are skipped.
    CHECK(walker.GetLinks(3) == std::vector<std::string>{"https://azoramoon.com/series/quiet-harbor/"});
}

TEST_CASE("CatalogWalker collects every page into one deduplicated set") {
    auto transport = std::make_shared<FakeTransport>();
    ServeCatalog(*transport);
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    std::set<std::string> expected = {
        "https://azoramoon.com/series/tower-of-ash/",
        "https://azoramoon.com/series/tower-gate/",
        "https://azoramoon.com/series/red-lantern/",
        "https://azoramoon.com/series/salt-and-iron/",
        "https://azoramoon.com/series/quiet-harbor/"};
    CHECK(walker.Start(3) == expected);
    CHECK(walker.Enumerate() == expected);
    for (int page = 1; page <= 3; ++page) {
        CHECK(transport->Calls(Page(page)) >= 1);
    }
}

TEST_CASE("CatalogWalker drops a page that keeps failing") {
    auto transport = std::make_shared<FakeTransport>();
    ServeCatalog(*transport);
    transport->Fail(Page(2));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    std::set<std::string> links = walker.Start(3);
    CHECK(links == std::set<std::string>{
        "https://azoramoon.com/series/tower-of-ash/",
        "https://azoramoon.com/series/tower-gate/",
        "https://azoramoon.com/series/red-lantern/",
        "https://azoramoon.com/series/quiet-harbor/"});
    CHECK(links.count("https://azoramoon.com/series/salt-and-iron/") == 0);
    CHECK(transport->Calls(Page(2)) == 3);
}

TEST_CASE("CatalogWalker never exceeds max_workers concurrent requests") {
    auto transport = std::make_shared<FakeTransport>();
    for (int page = 1; page <= 12; ++page) {
        transport->Serve(Page(page), LoadFixture("catalog_page2.html"));
    }
    transport->SetLatency(std::chrono::milliseconds(20));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker::Options options;
    options.max_workers = 3;
    CatalogWalker walker(client, options);

    std::set<std::string> links = walker.Start(12);
    CHECK(links.size() == 2);
    CHECK(transport->Requests().size() == 12);
    CHECK(transport->MaxInFlight() <= 3);
    CHECK(transport->MaxInFlight() >= 1);
}

TEST_CASE("CatalogWalker with nothing to fetch returns an empty set") {
    auto transport = std::make_shared<FakeTransport>();
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK(walker.Start(0).empty());
    CHECK(transport->Requests().empty());
}

TEST_CASE("CatalogWalker propagates a failure to read the first page") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Fail(Page(1));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK_THROWS_AS(walker.GetTotalPages(), NetworkError);
}

TEST_CASE("CatalogWalker takes the highest listed page when there is no last link") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(Page(1), LoadFixture("catalog_page_numbers.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    // The result count alone would give 3.
    CHECK(walker.GetTotalPages() == 7);
}

TEST_CASE("CatalogWalker page count survives the largest representable result count") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(Page(1), LoadFixture("catalog_huge_count.html"));
    FetchClient client(transport, RetryPolicy{}, [](std::chrono::milliseconds) {});
    CatalogWalker walker(client, {});

    CHECK(walker.GetTotalPages() == 178956971);
}

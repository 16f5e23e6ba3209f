#include <catch2/catch_all.hpp>
#include <memory>
#include <vector>
#include "FakeTransport.hpp"
#include "network/FetchClient.hpp"
#include "utils/Errors.hpp"

using namespace MangaHarvest;
using MangaHarvest::Testing::FakeTransport;
using std::chrono::milliseconds;

namespace {
const std::string kUrl = "https://azoramoon.com/series/tower-of-ash/";
}

TEST_CASE("FetchClient retries retryable statuses with exponential backoff") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Sequence(kUrl, {FakeTransport::Ok("busy", 502), FakeTransport::Ok("busy", 500), FakeTransport::Ok("<html>ok</html>")});
    std::vector<milliseconds> delays;
    FetchClient client(transport, RetryPolicy{}, [&delays](milliseconds d) { delays.push_back(d); });

    CHECK(client.FetchBytes(kUrl) == "<html>ok</html>");
    CHECK(transport->Calls(kUrl) == 3);
    REQUIRE(delays.size() == 2);
    CHECK(delays[0] == milliseconds(300));
    CHECK(delays[1] == milliseconds(600));
}

TEST_CASE("FetchClient fails a 4xx response without retrying") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kUrl, "gone", 404);
    std::vector<milliseconds> delays;
    FetchClient client(transport, RetryPolicy{}, [&delays](milliseconds d) { delays.push_back(d); });

    try {
        client.FetchBytes(kUrl);
        FAIL("expected NetworkError");
    } catch (const NetworkError& e) {
        CHECK(e.url() == kUrl);
        CHECK(e.attempts() == 1);
        CHECK(e.status() == 404);
    }
    CHECK(transport->Calls(kUrl) == 1);
    CHECK(delays.empty());
}

TEST_CASE("FetchClient does not retry a 5xx status outside the retry list") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kUrl, "unavailable", 503);
    FetchClient client(transport, RetryPolicy{}, [](milliseconds) {});

    REQUIRE_THROWS_AS(client.FetchBytes(kUrl), NetworkError);
    CHECK(transport->Calls(kUrl) == 1);
}

TEST_CASE("FetchClient gives up after max_attempts connection failures") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Fail(kUrl, "Connection refused");
    std::vector<milliseconds> delays;
    FetchClient client(transport, RetryPolicy{}, [&delays](milliseconds d) { delays.push_back(d); });

    try {
        client.FetchBytes(kUrl);
        FAIL("expected NetworkError");
    } catch (const NetworkError& e) {
        CHECK(e.attempts() == 3);
        CHECK(e.status() == 0);
        CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("Connection refused"));
        CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring(kUrl));
    }
    CHECK(transport->Calls(kUrl) == 3);
    CHECK(delays.size() == 2);
}

TEST_CASE("FetchClient honours a custom retry policy") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Serve(kUrl, "unavailable", 503);
    RetryPolicy policy;
    policy.max_attempts = 5;
    policy.backoff_factor = 1.0;
    policy.retry_statuses = {503};
    std::vector<milliseconds> delays;
    FetchClient client(transport, policy, [&delays](milliseconds d) { delays.push_back(d); });

    REQUIRE_THROWS_AS(client.FetchBytes(kUrl), NetworkError);
    CHECK(transport->Calls(kUrl) == 5);
    CHECK(delays == std::vector<milliseconds>{milliseconds(1000), milliseconds(2000), milliseconds(4000), milliseconds(8000)});
}

TEST_CASE("FetchClient encodes query parameters in order") {
    auto transport = std::make_shared<FakeTransport>();
    const std::string expected = "https://azoramoon.com/?s=one%20piece&post_type=wp-manga";
    transport->Serve(expected, "<h1>1 results</h1>");
    FetchClient client(transport, RetryPolicy{}, [](milliseconds) {});

    HtmlDocument doc = client.FetchDocument("https://azoramoon.com/", {{"s", "one piece"}, {"post_type", "wp-manga"}});
    CHECK(doc.GetText("h1") == std::optional<std::string>("1 results"));
    CHECK(transport->Requests() == std::vector<std::string>{expected});
}

TEST_CASE("FetchClient does not retry an oversized response") {
    auto transport = std::make_shared<FakeTransport>();
    transport->Sequence(kUrl, {FakeTransport::PermanentError("response exceeds 67108864 bytes"), FakeTransport::Ok("small")});
    std::vector<milliseconds> delays;
    FetchClient client(transport, RetryPolicy{}, [&delays](milliseconds d) { delays.push_back(d); });

    try {
        client.FetchBytes(kUrl);
        FAIL("expected NetworkError");
    } catch (const NetworkError& e) {
        CHECK(e.attempts() == 1);
        CHECK_THAT(e.what(), Catch::Matchers::ContainsSubstring("exceeds"));
    }
    CHECK(transport->Calls(kUrl) == 1);
    CHECK(delays.empty());
}

#include <httplib.h>

#include <doctest/doctest.h>

#include <tabshell/web/HttpHelpers.hpp>
#include <tabshell/web/TabIdentifier.hpp>

#include <chrono>
#include <string>

using namespace TS;
using namespace TS::Serve;
using namespace std::chrono_literals;

TEST_SUITE("web.helpers") {
TEST_CASE("Tab identifiers") {
    CHECK(is_tab_id("default"));
    CHECK(is_tab_id("tab-1.two_3"));
    CHECK(is_tab_id(std::string(kMaxTabIdLength, 'a')));
    CHECK_FALSE(is_tab_id(std::string(kMaxTabIdLength + 1, 'a')));
    CHECK_FALSE(is_tab_id(""));
    CHECK_FALSE(is_tab_id("."));
    CHECK_FALSE(is_tab_id(".."));
    CHECK_FALSE(is_tab_id("a/b"));
    CHECK_FALSE(is_tab_id("has space"));
}

TEST_CASE("TokenBucketRateLimiter") {
    auto const start = TokenBucketRateLimiter::Clock::now();

    SUBCASE("burst then refill") {
        TokenBucketRateLimiter limiter{60, 2};
        CHECK(limiter.allow("1.2.3.4", start));
        CHECK(limiter.allow("1.2.3.4", start));
        CHECK_FALSE(limiter.allow("1.2.3.4", start));
        CHECK(limiter.allow("5.6.7.8", start));
        CHECK(limiter.allow("1.2.3.4", start + 1s));
        CHECK_FALSE(limiter.allow("1.2.3.4", start + 1s));
    }

    SUBCASE("refill never exceeds the burst") {
        TokenBucketRateLimiter limiter{600, 1};
        CHECK(limiter.allow("k", start));
        CHECK(limiter.allow("k", start + 1h));
        CHECK_FALSE(limiter.allow("k", start + 1h));
    }

    SUBCASE("disabled limiters allow everything") {
        TokenBucketRateLimiter no_rate{0, 5};
        TokenBucketRateLimiter no_burst{60, 0};
        for (int i = 0; i < 100; ++i) {
            CHECK(no_rate.allow("k", start));
            CHECK(no_burst.allow("k", start));
        }
    }

    SUBCASE("empty keys share one bucket") {
        TokenBucketRateLimiter limiter{60, 1};
        CHECK(limiter.allow("", start));
        CHECK_FALSE(limiter.allow("", start));
    }
}

TEST_CASE("Client address") {
    httplib::Request req;
    CHECK(get_client_address(req) == "<unknown>");

    req.set_header("X-Forwarded-For", " 10.0.0.7 , 10.0.0.1");
    CHECK(get_client_address(req) == "10.0.0.7");

    req.remote_addr = "192.168.1.5";
    CHECK(get_client_address(req) == "192.168.1.5");
}

TEST_CASE("Error responses") {
    SUBCASE("status mapping") {
        CHECK(http_status_for(Error{Error::Code::InvalidArguments, ""}) == 400);
        CHECK(http_status_for(Error{Error::Code::UnrecognizedIntent, ""}) == 400);
        CHECK(http_status_for(Error{Error::Code::Forbidden, ""}) == 403);
        CHECK(http_status_for(Error{Error::Code::PermissionDenied, ""}) == 403);
        CHECK(http_status_for(Error{Error::Code::NotFound, ""}) == 404);
        CHECK(http_status_for(Error{Error::Code::AlreadyExists, ""}) == 409);
        CHECK(http_status_for(Error{Error::Code::CapacityExceeded, ""}) == 429);
        CHECK(http_status_for(Error{Error::Code::ChannelClosed, ""}) == 503);
        CHECK(http_status_for(Error{Error::Code::Timeout, ""}) == 504);
        CHECK(http_status_for(Error{Error::Code::ExecutionFailed, ""}) == 500);
    }

    SUBCASE("respond_error writes a JSON body") {
        httplib::Response res;
        respond_error(res, Error{Error::Code::NotFound, "no such tab"});
        CHECK(res.status == 404);
        CHECK(res.get_header_value("Cache-Control") == "no-store");
        auto body = nlohmann::json::parse(res.body);
        CHECK(body["error"] == "not_found");
        CHECK(body["message"] == "no such tab");
    }

    SUBCASE("rate limited responses carry Retry-After") {
        httplib::Response res;
        respond_rate_limited(res);
        CHECK(res.status == 429);
        CHECK(res.get_header_value("Retry-After") == "1");
    }

    SUBCASE("payload too large") {
        httplib::Response res;
        respond_payload_too_large(res);
        CHECK(res.status == 413);
        CHECK(nlohmann::json::parse(res.body)["error"] == "payload_too_large");
    }
}

TEST_CASE("JSON bodies") {
    httplib::Response res;
    httplib::Request  req;

    SUBCASE("empty body is an empty object") {
        req.body = "  \n";
        auto parsed = parse_json_body(req, res);
        REQUIRE(parsed.has_value());
        CHECK(parsed->is_object());
        CHECK(parsed->empty());
    }

    SUBCASE("objects parse") {
        req.body    = R"({"command":"ls","tab_id":"t1"})";
        auto parsed = parse_json_body(req, res);
        REQUIRE(parsed.has_value());
        CHECK((*parsed)["command"] == "ls");
    }

    SUBCASE("invalid JSON is a bad request") {
        req.body = "{nope";
        CHECK_FALSE(parse_json_body(req, res).has_value());
        CHECK(res.status == 400);
    }

    SUBCASE("non-objects are a bad request") {
        req.body = "[1,2]";
        CHECK_FALSE(parse_json_body(req, res).has_value());
        CHECK(res.status == 400);
    }

    SUBCASE("oversized bodies are refused") {
        req.body = std::string(kMaxRequestBodyBytes + 1, ' ');
        CHECK_FALSE(parse_json_body(req, res).has_value());
        CHECK(res.status == 413);
    }
}

TEST_CASE("Tab id extraction") {
    httplib::Response res;

    SUBCASE("from a JSON body") {
        auto missing = read_tab_id(nlohmann::json::object(), res);
        REQUIRE(missing.has_value());
        CHECK(*missing == kDefaultTabId);

        auto empty = read_tab_id(nlohmann::json{{"tab_id", ""}}, res);
        REQUIRE(empty.has_value());
        CHECK(*empty == kDefaultTabId);

        auto given = read_tab_id(nlohmann::json{{"tab_id", "tab-2"}}, res);
        REQUIRE(given.has_value());
        CHECK(*given == "tab-2");

        CHECK_FALSE(read_tab_id(nlohmann::json{{"tab_id", 7}}, res).has_value());
        CHECK(res.status == 400);
    }

    SUBCASE("from the query string") {
        httplib::Request req;
        auto             fallback = read_tab_id(req, res);
        REQUIRE(fallback.has_value());
        CHECK(*fallback == kDefaultTabId);

        req.params.emplace("tab_id", "tab-3");
        auto given = read_tab_id(req, res);
        REQUIRE(given.has_value());
        CHECK(*given == "tab-3");
    }

    SUBCASE("invalid ids are rejected") {
        httplib::Request req;
        req.params.emplace("tab_id", "../etc");
        CHECK_FALSE(read_tab_id(req, res).has_value());
        CHECK(res.status == 400);
    }
}
}

#pragma once

#include <tabshell/core/Error.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace httplib {
struct Request;
struct Response;
} // namespace httplib

namespace TS::Shell {
class ShellEngine;
}

namespace TS::Serve {

struct ShellServerOptions;
class MetricsCollector;

inline constexpr std::size_t      kMaxRequestBodyBytes = 1024 * 1024;
inline constexpr std::string_view kDefaultTabId        = "default";

class TokenBucketRateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    // A non-positive rate or burst disables limiting.
    TokenBucketRateLimiter(std::int64_t per_minute, std::int64_t burst);

    auto allow(std::string_view key, Clock::time_point now = Clock::now()) -> bool;

private:
    struct Bucket {
        double            tokens{0.0};
        Clock::time_point last_refill{};
        Clock::time_point last_used{};
    };

    auto enabled() const -> bool;
    void prune_locked(Clock::time_point now);

    double                                  capacity_{0.0};
    double                                  refill_per_second_{0.0};
    std::unordered_map<std::string, Bucket> buckets_;
    std::size_t                             operations_since_prune_{0};
    std::mutex                              mutex_;
};

struct HttpRequestContext {
    Shell::ShellEngine&       engine;
    ShellServerOptions const& options;
    MetricsCollector&         metrics;
    TokenBucketRateLimiter&   ip_rate_limiter;
    TokenBucketRateLimiter&   tab_rate_limiter;
    std::atomic<bool>&        should_stop;
};

auto get_client_address(httplib::Request const& req) -> std::string;

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store = false);

void respond_bad_request(httplib::Response& res, std::string_view message);
void respond_not_found(httplib::Response& res, std::string_view message);
void respond_server_error(httplib::Response& res, std::string_view message);
void respond_payload_too_large(httplib::Response& res);
void respond_rate_limited(httplib::Response& res);
void respond_unavailable(httplib::Response& res, std::string_view message);
// Maps an engine error onto an HTTP status and a JSON error body.
void respond_error(httplib::Response& res, Error const& error);

auto http_status_for(Error const& error) -> int;

// Parses a JSON object body. An empty body is an empty object. On failure the
// response is already written.
auto parse_json_body(httplib::Request const& req, httplib::Response& res) -> std::optional<nlohmann::json>;

// Reads `tab_id` from a JSON body, falling back to "default". Writes a 400 on
// a value that is not a valid tab id.
auto read_tab_id(nlohmann::json const& body, httplib::Response& res) -> std::optional<std::string>;
// Same, for the `tab_id` query parameter.
auto read_tab_id(httplib::Request const& req, httplib::Response& res) -> std::optional<std::string>;

// Applies the per-IP bucket, then the per-tab bucket when a tab is known.
auto apply_rate_limits(HttpRequestContext&        ctx,
                       std::string_view           route_name,
                       httplib::Request const&    req,
                       httplib::Response&         res,
                       std::optional<std::string> tab_id = std::nullopt) -> bool;

} // namespace TS::Serve

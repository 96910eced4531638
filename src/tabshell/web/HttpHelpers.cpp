#include <tabshell/web/HttpHelpers.hpp>

#include <tabshell/web/Metrics.hpp>
#include <tabshell/web/TabIdentifier.hpp>

#include "utils/TaggedLogger.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace TS::Serve {

namespace {

std::string trim_view(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())) != 0) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())) != 0) {
        value.remove_suffix(1);
    }
    return std::string{value};
}

auto validate_tab_id(std::string value, httplib::Response& res) -> std::optional<std::string> {
    if (value.empty()) {
        return std::string{kDefaultTabId};
    }
    if (!is_tab_id(value)) {
        respond_bad_request(res, "tab_id must be 1-128 characters of letters, digits, '_', '-' or '.'");
        return std::nullopt;
    }
    return value;
}

} // namespace

TokenBucketRateLimiter::TokenBucketRateLimiter(std::int64_t per_minute, std::int64_t burst)
    : capacity_{static_cast<double>(std::max<std::int64_t>(burst, 0))}
    , refill_per_second_{per_minute <= 0 ? 0.0 : static_cast<double>(per_minute) / 60.0} {}

auto TokenBucketRateLimiter::allow(std::string_view key, Clock::time_point now) -> bool {
    if (!enabled()) {
        return true;
    }

    std::string normalized_key = key.empty() ? std::string{"<unknown>"} : std::string{key};

    std::lock_guard const lock{mutex_};
    auto&                 bucket = buckets_[normalized_key];

    if (bucket.last_refill.time_since_epoch().count() == 0) {
        bucket.tokens      = capacity_;
        bucket.last_refill = now;
    } else if (now > bucket.last_refill) {
        auto const delta   = std::chrono::duration<double>(now - bucket.last_refill).count();
        bucket.tokens      = std::min(capacity_, bucket.tokens + delta * refill_per_second_);
        bucket.last_refill = now;
    }

    bucket.last_used = now;
    bool const allowed = bucket.tokens >= 1.0;
    if (allowed) {
        bucket.tokens -= 1.0;
    }
    prune_locked(now);
    return allowed;
}

auto TokenBucketRateLimiter::enabled() const -> bool {
    return capacity_ > 0.0 && refill_per_second_ > 0.0;
}

void TokenBucketRateLimiter::prune_locked(Clock::time_point now) {
    if (++operations_since_prune_ < 512) {
        return;
    }
    operations_since_prune_ = 0;
    auto const max_idle     = std::chrono::minutes{10};
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        if ((now - it->second.last_used) > max_idle || buckets_.size() > 4096) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

auto get_client_address(httplib::Request const& req) -> std::string {
    if (!req.remote_addr.empty()) {
        return req.remote_addr;
    }
    auto forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        return trim_view(std::string_view{forwarded}.substr(0, forwarded.find(',')));
    }
    return "<unknown>";
}

void write_json_response(httplib::Response& res, nlohmann::json const& payload, int status, bool no_store) {
    res.status = status;
    res.set_content(payload.dump(), "application/json; charset=utf-8");
    if (no_store) {
        res.set_header("Cache-Control", "no-store");
    }
}

void respond_bad_request(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "bad_request"}, {"message", message}}, 400, true);
}

void respond_not_found(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "not_found"}, {"message", message}}, 404, true);
}

void respond_server_error(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "internal"}, {"message", message}}, 500);
}

void respond_payload_too_large(httplib::Response& res) {
    write_json_response(res,
                        nlohmann::json{{"error", "payload_too_large"},
                                       {"message", "Request body exceeds 1 MiB limit"}},
                        413,
                        true);
}

void respond_rate_limited(httplib::Response& res) {
    write_json_response(res, nlohmann::json{{"error", "rate_limited"}, {"message", "Too many requests"}}, 429, true);
    res.set_header("Retry-After", "1");
}

void respond_unavailable(httplib::Response& res, std::string_view message) {
    write_json_response(res, nlohmann::json{{"error", "unavailable"}, {"message", message}}, 503, true);
}

auto http_status_for(Error const& error) -> int {
    switch (error.code) {
    case Error::Code::MalformedInput:
    case Error::Code::UnrecognizedIntent:
    case Error::Code::InvalidArguments:
        return 400;
    case Error::Code::Forbidden:
    case Error::Code::PermissionDenied:
        return 403;
    case Error::Code::NotFound:
        return 404;
    case Error::Code::AlreadyExists:
        return 409;
    case Error::Code::CapacityExceeded:
        return 429;
    case Error::Code::ChannelClosed:
        return 503;
    case Error::Code::Timeout:
        return 504;
    default:
        return 500;
    }
}

void respond_error(httplib::Response& res, Error const& error) {
    nlohmann::json payload{{"error", errorCodeToString(error.code)},
                           {"message", error.message.value_or(std::string{})}};
    write_json_response(res, payload, http_status_for(error), true);
}

auto parse_json_body(httplib::Request const& req, httplib::Response& res) -> std::optional<nlohmann::json> {
    if (req.body.size() > kMaxRequestBodyBytes) {
        respond_payload_too_large(res);
        return std::nullopt;
    }
    if (trim_view(req.body).empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(req.body, nullptr, false);
    if (parsed.is_discarded()) {
        respond_bad_request(res, "Request body must be valid JSON");
        return std::nullopt;
    }
    if (!parsed.is_object()) {
        respond_bad_request(res, "Request body must be a JSON object");
        return std::nullopt;
    }
    return parsed;
}

auto read_tab_id(nlohmann::json const& body, httplib::Response& res) -> std::optional<std::string> {
    auto it = body.find("tab_id");
    if (it == body.end() || it->is_null()) {
        return std::string{kDefaultTabId};
    }
    if (!it->is_string()) {
        respond_bad_request(res, "tab_id must be a string");
        return std::nullopt;
    }
    return validate_tab_id(it->get<std::string>(), res);
}

auto read_tab_id(httplib::Request const& req, httplib::Response& res) -> std::optional<std::string> {
    if (!req.has_param("tab_id")) {
        return std::string{kDefaultTabId};
    }
    return validate_tab_id(req.get_param_value("tab_id"), res);
}

auto apply_rate_limits(HttpRequestContext&        ctx,
                       std::string_view           route_name,
                       httplib::Request const&    req,
                       httplib::Response&         res,
                       std::optional<std::string> tab_id) -> bool {
    auto const now         = TokenBucketRateLimiter::Clock::now();
    auto const remote_addr = get_client_address(req);

    if (!ctx.ip_rate_limiter.allow(remote_addr, now)) {
        respond_rate_limited(res);
        ctx.metrics.record_rate_limit("ip", route_name);
        ts_log("Rate limited " + remote_addr + " on " + std::string{route_name}, "RateLimit");
        return false;
    }

    if (tab_id && !ctx.tab_rate_limiter.allow(*tab_id, now)) {
        respond_rate_limited(res);
        ctx.metrics.record_rate_limit("tab", route_name);
        ts_log("Rate limited tab " + *tab_id + " on " + std::string{route_name}, "RateLimit");
        return false;
    }

    return true;
}

} // namespace TS::Serve

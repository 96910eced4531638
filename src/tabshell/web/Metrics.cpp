#include <tabshell/web/Metrics.hpp>

#include <tabshell/core/TimeUtils.hpp>

#include <httplib.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>

namespace TS::Serve {

using json = nlohmann::json;

namespace {

constexpr std::array<std::pair<RouteMetric, char const*>, static_cast<std::size_t>(RouteMetric::Count)>
    kRouteMetricNames{{
        {RouteMetric::Root, "root"},
        {RouteMetric::Healthz, "healthz"},
        {RouteMetric::Metrics, "metrics"},
        {RouteMetric::SystemInfo, "system_info"},
        {RouteMetric::Tabs, "tabs"},
        {RouteMetric::Command, "command"},
        {RouteMetric::Autocomplete, "autocomplete"},
        {RouteMetric::History, "history"},
        {RouteMetric::Events, "events"},
        {RouteMetric::ExportLogs, "export_logs"},
    }};

auto bucket_label(double boundary_ms) -> std::string {
    return std::isinf(boundary_ms) ? std::string{"+Inf"} : std::to_string(boundary_ms / 1000.0);
}

auto average_ms(MetricsCollector::HistogramSnapshot const& histogram) -> double {
    if (histogram.count == 0) {
        return 0.0;
    }
    return static_cast<double>(histogram.sum_micros) / 1000.0 / static_cast<double>(histogram.count);
}

} // namespace

auto route_metric_name(RouteMetric route) -> std::string_view {
    auto const index = static_cast<std::size_t>(route);
    if (index >= kRouteMetricNames.size()) {
        return "unknown";
    }
    return kRouteMetricNames[index].second;
}

void MetricsCollector::Histogram::observe(std::chrono::microseconds value) {
    auto const micros = static_cast<std::uint64_t>(std::max<std::int64_t>(value.count(), 0));
    sum_micros_.fetch_add(micros, std::memory_order_relaxed);
    count_.fetch_add(1, std::memory_order_relaxed);
    double const millis = static_cast<double>(micros) / 1000.0;
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        if (millis <= kLatencyBucketsMs[i]) {
            buckets_[i].fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
    buckets_.back().fetch_add(1, std::memory_order_relaxed);
}

auto MetricsCollector::Histogram::snapshot() const -> HistogramSnapshot {
    HistogramSnapshot snapshot{};
    for (std::size_t i = 0; i < kLatencyBucketsMs.size(); ++i) {
        snapshot.buckets[i] = buckets_[i].load(std::memory_order_relaxed);
    }
    snapshot.count      = count_.load(std::memory_order_relaxed);
    snapshot.sum_micros = sum_micros_.load(std::memory_order_relaxed);
    return snapshot;
}

auto MetricsCollector::Histogram::bucket_boundaries()
    -> std::array<double, HistogramSnapshot::kBucketCount> const& {
    return kLatencyBucketsMs;
}

auto MetricsCollector::RateLimitKey::operator<(RateLimitKey const& other) const -> bool {
    if (scope != other.scope) {
        return scope < other.scope;
    }
    return route < other.route;
}

void MetricsCollector::record_request(RouteMetric route, int status, std::chrono::microseconds latency) {
    auto const index = static_cast<std::size_t>(route);
    if (index >= routes_.size()) {
        return;
    }
    auto& counters = routes_[index];
    counters.latency.observe(latency);
    counters.total.fetch_add(1, std::memory_order_relaxed);
    int const effective_status = status <= 0 ? 200 : status;
    if (effective_status >= 400) {
        counters.errors.fetch_add(1, std::memory_order_relaxed);
    }
}

void MetricsCollector::record_rate_limit(std::string_view scope, std::string_view route) {
    std::lock_guard const lock{rate_limit_mutex_};
    rate_limit_counts_[RateLimitKey{std::string{scope}, std::string{route}}] += 1;
}

void MetricsCollector::record_sse_connection_open() {
    sse_connections_current_.fetch_add(1, std::memory_order_relaxed);
    sse_connections_total_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsCollector::record_sse_connection_close() {
    sse_connections_current_.fetch_sub(1, std::memory_order_relaxed);
}

void MetricsCollector::record_sse_event(std::string_view event_type) {
    std::lock_guard const lock{sse_event_mutex_};
    sse_event_counts_[std::string{event_type}] += 1;
}

void MetricsCollector::record_command(bool failed, std::chrono::microseconds latency) {
    commands_total_.fetch_add(1, std::memory_order_relaxed);
    if (failed) {
        command_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    command_latency_.observe(latency);
}

auto MetricsCollector::capture_snapshot() const -> MetricsSnapshot {
    MetricsSnapshot snapshot;
    snapshot.captured_at = std::chrono::system_clock::now();
    for (std::size_t i = 0; i < routes_.size(); ++i) {
        snapshot.routes[i].latency = routes_[i].latency.snapshot();
        snapshot.routes[i].total   = routes_[i].total.load(std::memory_order_relaxed);
        snapshot.routes[i].errors  = routes_[i].errors.load(std::memory_order_relaxed);
    }
    snapshot.sse_connections_current = sse_connections_current_.load(std::memory_order_relaxed);
    snapshot.sse_connections_total   = sse_connections_total_.load(std::memory_order_relaxed);
    snapshot.commands_total          = commands_total_.load(std::memory_order_relaxed);
    snapshot.command_errors          = command_errors_.load(std::memory_order_relaxed);
    snapshot.command_latency         = command_latency_.snapshot();

    {
        std::lock_guard const lock{rate_limit_mutex_};
        snapshot.rate_limits.reserve(rate_limit_counts_.size());
        for (auto const& [key, count] : rate_limit_counts_) {
            snapshot.rate_limits.push_back(MetricsSnapshot::RateLimitEntry{key.scope, key.route, count});
        }
    }

    {
        std::lock_guard const lock{sse_event_mutex_};
        snapshot.sse_events.reserve(sse_event_counts_.size());
        for (auto const& [type, count] : sse_event_counts_) {
            snapshot.sse_events.push_back(MetricsSnapshot::SseEventEntry{type, count});
        }
    }

    return snapshot;
}

auto MetricsCollector::render_prometheus() const -> std::string {
    return render_prometheus(capture_snapshot());
}

auto MetricsCollector::render_prometheus(MetricsSnapshot const& snapshot) const -> std::string {
    metrics_scrapes_.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream out;
    auto const&        buckets = Histogram::bucket_boundaries();

    out << "# HELP tabshell_request_duration_seconds Request latency histogram\n";
    out << "# TYPE tabshell_request_duration_seconds histogram\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const&   route_stats = snapshot.routes[i];
        auto const*   name        = kRouteMetricNames[i].second;
        std::uint64_t cumulative  = 0;
        for (std::size_t b = 0; b < buckets.size(); ++b) {
            cumulative += route_stats.latency.buckets[b];
            out << "tabshell_request_duration_seconds_bucket{route=\"" << name << "\",le=\""
                << bucket_label(buckets[b]) << "\"} " << cumulative << "\n";
        }
        out << "tabshell_request_duration_seconds_sum{route=\"" << name << "\"} "
            << (route_stats.latency.sum_micros / 1'000'000.0) << "\n";
        out << "tabshell_request_duration_seconds_count{route=\"" << name << "\"} "
            << route_stats.latency.count << "\n";
    }

    out << "# HELP tabshell_requests_total Total HTTP requests\n";
    out << "# TYPE tabshell_requests_total counter\n";
    out << "# HELP tabshell_request_errors_total HTTP requests returning >=400\n";
    out << "# TYPE tabshell_request_errors_total counter\n";
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const* name = kRouteMetricNames[i].second;
        out << "tabshell_requests_total{route=\"" << name << "\"} " << snapshot.routes[i].total << "\n";
        out << "tabshell_request_errors_total{route=\"" << name << "\"} " << snapshot.routes[i].errors << "\n";
    }

    out << "# HELP tabshell_sse_connections Current SSE connections\n";
    out << "# TYPE tabshell_sse_connections gauge\n";
    out << "tabshell_sse_connections " << snapshot.sse_connections_current << "\n";
    out << "# HELP tabshell_sse_connections_total Total SSE connections opened\n";
    out << "# TYPE tabshell_sse_connections_total counter\n";
    out << "tabshell_sse_connections_total " << snapshot.sse_connections_total << "\n";

    if (!snapshot.sse_events.empty()) {
        out << "# HELP tabshell_sse_events_total SSE events emitted by type\n";
        out << "# TYPE tabshell_sse_events_total counter\n";
        for (auto const& entry : snapshot.sse_events) {
            out << "tabshell_sse_events_total{type=\"" << entry.type << "\"} " << entry.count << "\n";
        }
    }

    out << "# HELP tabshell_commands_total Commands executed\n";
    out << "# TYPE tabshell_commands_total counter\n";
    out << "tabshell_commands_total " << snapshot.commands_total << "\n";
    out << "# HELP tabshell_command_errors_total Commands that produced an error event\n";
    out << "# TYPE tabshell_command_errors_total counter\n";
    out << "tabshell_command_errors_total " << snapshot.command_errors << "\n";

    out << "# HELP tabshell_command_duration_seconds Command latency from submission to completion\n";
    out << "# TYPE tabshell_command_duration_seconds histogram\n";
    std::uint64_t cumulative = 0;
    for (std::size_t b = 0; b < buckets.size(); ++b) {
        cumulative += snapshot.command_latency.buckets[b];
        out << "tabshell_command_duration_seconds_bucket{le=\"" << bucket_label(buckets[b]) << "\"} "
            << cumulative << "\n";
    }
    out << "tabshell_command_duration_seconds_sum " << (snapshot.command_latency.sum_micros / 1'000'000.0)
        << "\n";
    out << "tabshell_command_duration_seconds_count " << snapshot.command_latency.count << "\n";

    if (!snapshot.rate_limits.empty()) {
        out << "# HELP tabshell_rate_limit_rejections_total Rate-limited requests\n";
        out << "# TYPE tabshell_rate_limit_rejections_total counter\n";
        for (auto const& entry : snapshot.rate_limits) {
            out << "tabshell_rate_limit_rejections_total{scope=\"" << entry.scope << "\",route=\""
                << entry.route << "\"} " << entry.count << "\n";
        }
    }

    out << "# HELP tabshell_metrics_scrapes_total Metrics scrapes\n";
    out << "# TYPE tabshell_metrics_scrapes_total counter\n";
    out << "tabshell_metrics_scrapes_total " << metrics_scrapes_.load(std::memory_order_relaxed) << "\n";

    return out.str();
}

auto MetricsCollector::snapshot_json() const -> json {
    return snapshot_json(capture_snapshot());
}

auto MetricsCollector::snapshot_json(MetricsSnapshot const& snapshot) const -> json {
    json payload;
    payload["captured_at"] = format_timestamp(snapshot.captured_at);

    json request_stats = json::object();
    for (std::size_t i = 0; i < snapshot.routes.size(); ++i) {
        auto const& stats = snapshot.routes[i];
        request_stats[kRouteMetricNames[i].second] =
            json{{"total", stats.total}, {"errors", stats.errors}, {"avg_ms", average_ms(stats.latency)}};
    }
    payload["requests"] = std::move(request_stats);

    payload["sse"] = json{{"connections_current", snapshot.sse_connections_current},
                          {"connections_total", snapshot.sse_connections_total}};

    payload["commands"] = json{{"total", snapshot.commands_total},
                               {"errors", snapshot.command_errors},
                               {"avg_ms", average_ms(snapshot.command_latency)}};

    json rate_limits = json::array();
    for (auto const& entry : snapshot.rate_limits) {
        rate_limits.push_back(json{{"scope", entry.scope}, {"route", entry.route}, {"count", entry.count}});
    }
    payload["rate_limits"] = std::move(rate_limits);

    json sse_events = json::array();
    for (auto const& entry : snapshot.sse_events) {
        sse_events.push_back(json{{"type", entry.type}, {"count", entry.count}});
    }
    payload["sse_events"] = std::move(sse_events);

    return payload;
}

RequestMetricsScope::RequestMetricsScope(MetricsCollector& metrics, RouteMetric route, httplib::Response& res)
    : metrics_{metrics}
    , route_{route}
    , response_{res}
    , start_{std::chrono::steady_clock::now()} {}

RequestMetricsScope::~RequestMetricsScope() {
    auto duration = std::chrono::steady_clock::now() - start_;
    metrics_.record_request(route_,
                            response_.status,
                            std::chrono::duration_cast<std::chrono::microseconds>(duration));
}

} // namespace TS::Serve

#include <tabshell/web/ShellController.hpp>

#include <tabshell/core/TimeUtils.hpp>
#include <tabshell/shell/ShellEngine.hpp>
#include <tabshell/web/HttpHelpers.hpp>
#include <tabshell/web/Metrics.hpp>
#include <tabshell/web/ShellServerOptions.hpp>
#include <tabshell/web/SseEventChannel.hpp>
#include <tabshell/web/TabIdentifier.hpp>
#include <tabshell/web/TranscriptExport.hpp>

#include "utils/TaggedLogger.hpp"

#include <httplib.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TS::Serve {

namespace {

using json = nlohmann::json;

constexpr char const* kBanner =
    "tabshell web terminal\n\n"
    "POST /api/tabs {\"tab_id\"?} opens a tab, GET /api/events?tab_id=<id> streams its output,\n"
    "POST /api/command {\"tab_id\",\"command\",\"wait\"?} runs a command in it.\n"
    "Also: /api/autocomplete, /api/history, /api/history/search, /api/export-logs, /api/system-info.\n";

// Grace period on top of the per-process timeout for a waiting request.
constexpr auto kWaitSlack         = std::chrono::seconds{5};
constexpr auto kWaitWithoutLimit  = std::chrono::seconds{60};

auto events_to_json(std::vector<Shell::OutputEvent> const& events) -> json {
    json array = json::array();
    for (auto const& event : events) {
        json entry     = event.to_json();
        entry["event"] = event.event_name();
        array.push_back(std::move(entry));
    }
    return array;
}

auto read_string_field(json const& body, char const* key, bool required, httplib::Response& res)
    -> std::optional<std::string> {
    auto it = body.find(key);
    if (it == body.end() || it->is_null()) {
        if (required) {
            respond_bad_request(res, std::string{key} + " is required");
            return std::nullopt;
        }
        return std::string{};
    }
    if (!it->is_string()) {
        respond_bad_request(res, std::string{key} + " must be a string");
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

auto ShellController::Create(HttpRequestContext& ctx) -> std::unique_ptr<ShellController> {
    return std::unique_ptr<ShellController>(new ShellController(ctx));
}

ShellController::ShellController(HttpRequestContext& ctx)
    : ctx_(ctx) {}

ShellController::~ShellController() = default;

void ShellController::register_routes(httplib::Server& server) {
    server.Get("/", [this](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Root, res};
        res.set_content(kBanner, "text/plain; charset=utf-8");
    });

    server.Get("/healthz", [this](httplib::Request const&, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Healthz, res};
        res.status = 200;
        res.set_content("ok", "text/plain; charset=utf-8");
    });

    server.Get("/metrics", [this](httplib::Request const& req, httplib::Response& res) {
        [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Metrics, res};
        if (!apply_rate_limits(ctx_, "metrics", req, res)) {
            return;
        }
        res.set_header("Cache-Control", "no-store");
        res.set_content(ctx_.metrics.render_prometheus(), "text/plain; version=0.0.4");
    });

    server.Get("/api/system-info", [this](httplib::Request const& req, httplib::Response& res) {
        handle_system_info(req, res);
    });
    server.Post("/api/tabs", [this](httplib::Request const& req, httplib::Response& res) {
        handle_open_tab(req, res);
    });
    server.Delete(R"(/api/tabs/([^/]+))", [this](httplib::Request const& req, httplib::Response& res) {
        handle_close_tab(req, res);
    });
    server.Post("/api/command", [this](httplib::Request const& req, httplib::Response& res) {
        handle_command(req, res);
    });
    server.Post("/api/autocomplete", [this](httplib::Request const& req, httplib::Response& res) {
        handle_autocomplete(req, res);
    });
    server.Get("/api/history", [this](httplib::Request const& req, httplib::Response& res) {
        handle_history(req, res);
    });
    server.Get("/api/history/search", [this](httplib::Request const& req, httplib::Response& res) {
        handle_history_search(req, res);
    });
    server.Get("/api/events", [this](httplib::Request const& req, httplib::Response& res) {
        handle_events(req, res);
    });
    server.Get("/api/export-logs", [this](httplib::Request const& req, httplib::Response& res) {
        handle_export_logs(req, res);
    });
}

void ShellController::handle_system_info(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::SystemInfo, res};
    if (!apply_rate_limits(ctx_, "system_info", req, res)) {
        return;
    }
    auto& sampler  = ctx_.engine.sampler();
    auto  snapshot = sampler.has_sample() ? sampler.latest() : sampler.sample();
    write_json_response(res, Shell::BroadcastHub::metrics_payload(snapshot), 200, true);
}

void ShellController::handle_open_tab(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Tabs, res};
    auto body = parse_json_body(req, res);
    if (!body) {
        return;
    }
    // Unlike the other routes, a missing tab_id asks for a fresh one.
    std::string tab_id;
    if (body->contains("tab_id") && !(*body)["tab_id"].is_null()) {
        auto requested = read_tab_id(*body, res);
        if (!requested) {
            return;
        }
        tab_id = std::move(*requested);
    }
    if (!apply_rate_limits(ctx_, "tabs", req, res, tab_id.empty() ? std::nullopt : std::optional{tab_id})) {
        return;
    }

    bool const existed = !tab_id.empty() && ctx_.engine.store().contains(tab_id);
    auto       session = ctx_.engine.open_session(tab_id);
    write_json_response(res,
                        json{{"tab_id", session->id()},
                             {"directory", session->current_directory()},
                             {"created", !existed}},
                        existed ? 200 : 201,
                        true);
}

void ShellController::handle_close_tab(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Tabs, res};
    std::string tab_id = req.matches.size() > 1 ? req.matches[1].str() : std::string{};
    if (!is_tab_id(tab_id)) {
        respond_bad_request(res, "tab_id must be 1-128 characters of letters, digits, '_', '-' or '.'");
        return;
    }
    if (!apply_rate_limits(ctx_, "tabs", req, res, tab_id)) {
        return;
    }
    if (!ctx_.engine.close_session(tab_id)) {
        respond_not_found(res, "no tab '" + tab_id + "'");
        return;
    }
    write_json_response(res, json{{"tab_id", tab_id}, {"closed", true}}, 200, true);
}

void ShellController::handle_command(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Command, res};
    auto body = parse_json_body(req, res);
    if (!body) {
        return;
    }
    auto tab_id = read_tab_id(*body, res);
    if (!tab_id) {
        return;
    }
    auto command = read_string_field(*body, "command", true, res);
    if (!command) {
        return;
    }
    bool wait = false;
    if (auto it = body->find("wait"); it != body->end() && !it->is_null()) {
        if (!it->is_boolean()) {
            respond_bad_request(res, "wait must be a boolean");
            return;
        }
        wait = it->get<bool>();
    }
    if (!apply_rate_limits(ctx_, "command", req, res, *tab_id)) {
        return;
    }

    using Events = std::vector<Shell::OutputEvent>;
    auto const started  = std::chrono::steady_clock::now();
    auto       promise  = wait ? std::make_shared<std::promise<Events>>() : nullptr;
    auto       future   = promise ? promise->get_future() : std::future<Events>{};
    auto*      metrics  = &ctx_.metrics;
    auto       complete = [metrics, started, promise](Events const& events) {
        bool const failed = std::any_of(events.begin(), events.end(), [](auto const& e) { return e.is_error(); });
        metrics->record_command(failed,
                                std::chrono::duration_cast<std::chrono::microseconds>(
                                    std::chrono::steady_clock::now() - started));
        if (promise) {
            promise->set_value(events);
        }
    };

    auto queued = ctx_.engine.submit(*tab_id, std::move(*command), std::move(complete));
    if (!queued) {
        respond_error(res, queued.error());
        return;
    }
    if (!wait) {
        write_json_response(res, json{{"tab_id", *tab_id}, {"queued", true}}, 202, true);
        return;
    }

    auto const limit   = ctx_.options.command_timeout_ms > 0
                             ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::milliseconds{ctx_.options.command_timeout_ms} + kWaitSlack)
                             : std::chrono::duration_cast<std::chrono::milliseconds>(kWaitWithoutLimit);
    if (future.wait_for(limit) != std::future_status::ready) {
        respond_error(res,
                      Error{Error::Code::Timeout,
                            "command still running after " + std::to_string(limit.count()) + " ms"});
        return;
    }
    try {
        auto events = future.get();
        write_json_response(res, json{{"tab_id", *tab_id}, {"events", events_to_json(events)}}, 200, true);
    } catch (std::future_error const&) {
        respond_error(res, Error{Error::Code::ChannelClosed, "command was discarded before it ran"});
    }
}

void ShellController::handle_autocomplete(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Autocomplete, res};
    auto body = parse_json_body(req, res);
    if (!body) {
        return;
    }
    auto tab_id = read_tab_id(*body, res);
    if (!tab_id) {
        return;
    }
    auto partial = read_string_field(*body, "command", false, res);
    if (!partial) {
        return;
    }
    if (!apply_rate_limits(ctx_, "autocomplete", req, res, *tab_id)) {
        return;
    }
    write_json_response(res,
                        json{{"tab_id", *tab_id}, {"suggestions", ctx_.engine.autocomplete(*tab_id, *partial)}},
                        200,
                        true);
}

void ShellController::handle_history(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::History, res};
    auto tab_id = read_tab_id(req, res);
    if (!tab_id || !apply_rate_limits(ctx_, "history", req, res, *tab_id)) {
        return;
    }
    write_json_response(res,
                        json{{"tab_id", *tab_id}, {"history", ctx_.engine.store().history(*tab_id)}},
                        200,
                        true);
}

void ShellController::handle_history_search(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::History, res};
    auto tab_id = read_tab_id(req, res);
    if (!tab_id || !apply_rate_limits(ctx_, "history", req, res, *tab_id)) {
        return;
    }
    auto const query   = req.get_param_value("q");
    json       results = json::array();
    for (auto const& entry : ctx_.engine.store().search_transcript(*tab_id, query)) {
        results.push_back(json{{"timestamp", format_timestamp(entry.timestamp)},
                               {"command", entry.command},
                               {"output", entry.output},
                               {"type", entry.is_error ? "error" : "output"}});
    }
    write_json_response(res, json{{"tab_id", *tab_id}, {"query", query}, {"results", std::move(results)}}, 200, true);
}

void ShellController::handle_events(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::Events, res};
    auto tab_id = read_tab_id(req, res);
    if (!tab_id || !apply_rate_limits(ctx_, "events", req, res, *tab_id)) {
        return;
    }

    auto session = ctx_.engine.open_session(*tab_id);
    auto channel = std::make_shared<SseEventChannel>(*tab_id,
                                                     json{{"tab_id", *tab_id},
                                                          {"directory", session->current_directory()}},
                                                     &ctx_.metrics,
                                                     ctx_.should_stop);
    auto const channel_id = ctx_.engine.connect(channel);
    ts_log("SSE channel " + std::to_string(channel_id) + " opened for " + *tab_id, "Events");

    res.set_header("Cache-Control", "no-store");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    ctx_.metrics.record_sse_connection_open();
    res.set_chunked_content_provider(
        "text/event-stream",
        [channel](std::size_t, httplib::DataSink& sink) { return channel->pump(sink); },
        [channel, channel_id, this](bool) {
            channel->close();
            ctx_.engine.disconnect(channel_id);
            ctx_.metrics.record_sse_connection_close();
        });
}

void ShellController::handle_export_logs(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::ExportLogs, res};
    auto format = parse_export_format(req.get_param_value("format"));
    if (!format) {
        respond_bad_request(res, "format must be 'txt' or 'md'");
        return;
    }

    std::optional<std::string> tab_id;
    if (req.has_param("tab_id")) {
        tab_id = read_tab_id(req, res);
        if (!tab_id) {
            return;
        }
    }
    if (!apply_rate_limits(ctx_, "export_logs", req, res, tab_id)) {
        return;
    }

    auto const& store   = ctx_.engine.store();
    auto        entries = tab_id ? store.transcript(*tab_id) : store.all_transcripts();
    res.status          = 200;
    res.set_header("Cache-Control", "no-store");
    res.set_header("Content-Disposition", "attachment; filename=\"" + export_filename(*format) + "\"");
    res.set_content(render_transcript(entries, *format), std::string{export_content_type(*format)});
}

} // namespace TS::Serve

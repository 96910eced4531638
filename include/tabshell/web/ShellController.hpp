#pragma once

#include <memory>

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace TS::Serve {

struct HttpRequestContext;

// The JSON API and the per-tab event stream.
class ShellController {
public:
    static auto Create(HttpRequestContext& ctx) -> std::unique_ptr<ShellController>;

    void register_routes(httplib::Server& server);

    ~ShellController();

private:
    explicit ShellController(HttpRequestContext& ctx);

    HttpRequestContext& ctx_;

    void handle_system_info(httplib::Request const& req, httplib::Response& res);
    void handle_open_tab(httplib::Request const& req, httplib::Response& res);
    void handle_close_tab(httplib::Request const& req, httplib::Response& res);
    void handle_command(httplib::Request const& req, httplib::Response& res);
    void handle_autocomplete(httplib::Request const& req, httplib::Response& res);
    void handle_history(httplib::Request const& req, httplib::Response& res);
    void handle_history_search(httplib::Request const& req, httplib::Response& res);
    void handle_events(httplib::Request const& req, httplib::Response& res);
    void handle_export_logs(httplib::Request const& req, httplib::Response& res);
};

} // namespace TS::Serve

#include "import_listener.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void json_response(httplib::Response& res, const json& j, int status = 200)
{
    res.status = status;
    res.set_content(j.dump(), "application/json");
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static json error_body(const HandoffError& e)
{
    return { { "error", error_kind_name(e.kind()) }, { "message", user_message(e.kind()) } };
}

// text/uri-list allows a trailing CRLF
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string first_uri(const std::string& body)
{
    const auto end = body.find_first_of("\r\n");
    return body.substr(0, end);
}

void configure_import_routes(httplib::Server& svr, StagingChannel& channel, ImportHandler on_import)
{
    svr.Get("/health",
            [](const httplib::Request&, httplib::Response& res)
            {
                json_response(res, { { "ok", true },
                                     { "service", "journey-handoff" },
                                     { "time", static_cast<std::int64_t>(std::time(nullptr)) } });
            });

    svr.Get("/pending",
            [&channel](const httplib::Request&, httplib::Response& res)
            {
                try
                {
                    json_response(res, { { "pending", channel.has_pending() } });
                }
                catch (const HandoffError& e)
                {
                    json_response(res, error_body(e), 503);
                }
            });

    svr.Post("/open",
             [&channel, on_import = std::move(on_import)](const httplib::Request& req, httplib::Response& res)
             {
                 if (first_uri(req.body) != channel.keys().wake_uri)
                 {
                     json_response(res, { { "error", "unknown_uri" } }, 404);
                     return;
                 }

                 try
                 {
                     auto imported = import_staged(channel, on_import);
                     if (!imported)
                     {
                         json_response(res, { { "status", "empty" } });
                         return;
                     }
                     json_response(res, { { "status", "imported" },
                                          { "filename", imported->filename },
                                          { "sender_name", imported->sender_name },
                                          { "location_count", imported->journey.total_locations },
                                          { "schema", schema_tag_name(imported->schema) } });
                 }
                 catch (const HandoffError& e)
                 {
                     std::cerr << "[journey-handoff] import failed: " << e.what() << '\n';
                     const int status = e.kind() == HandoffErrorKind::StoreUnavailable ? 503 : 422;
                     json_response(res, error_body(e), status);
                 }
             });
}

ImportPoller::ImportPoller(StagingChannel& channel, ImportHandler on_import, int interval_seconds)
    : channel_(channel), on_import_(std::move(on_import)), interval_seconds_(interval_seconds)
{
    thread_ = std::thread([this] { run(); });
}

ImportPoller::~ImportPoller()
{
    stop();
}

bool ImportPoller::poll_once()
{
    try
    {
        return import_staged(channel_, on_import_).has_value();
    }
    catch (const HandoffError& e)
    {
        std::cerr << "[journey-handoff] poll: " << error_kind_name(e.kind()) << ": " << e.what() << '\n';
        return false;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[journey-handoff] poll: import handler failed: " << e.what() << '\n';
        return false;
    }
}

void ImportPoller::stop()
{
    {
        std::scoped_lock lk(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
}

void ImportPoller::run()
{
    poll_once();
    if (interval_seconds_ <= 0)
        return;

    std::unique_lock lk(mu_);
    while (!cv_.wait_for(lk, std::chrono::seconds(interval_seconds_), [this] { return stopping_; }))
    {
        lk.unlock();
        poll_once();
        lk.lock();
    }
}

#include "wake_signal.hpp"

#include <httplib.h>
#include <utility>

HttpWakeSignal::HttpWakeSignal(std::string host, int port, int timeout_ms)
    : host_(std::move(host)), port_(port), timeout_ms_(timeout_ms)
{
}

bool HttpWakeSignal::wake(const std::string& uri)
{
    httplib::Client cli(host_, port_);
    const auto      sec  = static_cast<time_t>(timeout_ms_ / 1000);
    const auto      usec = static_cast<time_t>((timeout_ms_ % 1000) * 1000);
    cli.set_connection_timeout(sec, usec);
    cli.set_read_timeout(sec, usec);
    cli.set_write_timeout(sec, usec);

    auto res = cli.Post("/open", uri, "text/uri-list");
    if (res == nullptr)
        return false;
    // 422: the consumer woke up but rejected the staged data
    return (res->status >= 200 && res->status < 300) || res->status == 422;
}

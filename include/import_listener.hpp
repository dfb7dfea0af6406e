#pragma once
#include "journey_import.hpp"
#include "staging_channel.hpp"

#include <condition_variable>
#include <httplib.h>
#include <mutex>
#include <thread>

// Adds the consumer endpoints to `svr`: GET /health, GET /pending, POST /open.
// `channel` must outlive the server.
void configure_import_routes(httplib::Server& svr, StagingChannel& channel, ImportHandler on_import);

// Imports whatever is staged once at start (activation) and then every `interval_seconds`,
// independent of wake signals. interval_seconds <= 0 polls only once.
class ImportPoller
{
  public:
    ImportPoller(StagingChannel& channel, ImportHandler on_import, int interval_seconds);
    ~ImportPoller();

    ImportPoller(const ImportPoller&)            = delete;
    ImportPoller& operator=(const ImportPoller&) = delete;
    ImportPoller(ImportPoller&&)                 = delete;
    ImportPoller& operator=(ImportPoller&&)      = delete;

    // One import attempt; errors are logged. Returns true when a journey was imported.
    bool poll_once();

    void stop();

  private:
    void run();

    StagingChannel&         channel_;
    ImportHandler           on_import_;
    int                     interval_seconds_;
    std::mutex              mu_;
    std::condition_variable cv_;
    bool                    stopping_ = false;
    std::thread             thread_;
};

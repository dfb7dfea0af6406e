#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
// NOLINTNEXTLINE(cppcoreguidelines-macro-usage)
#define CPPHTTPLIB_THREAD_POOL_COUNT 2
#include "app_config.hpp"
#include "entry_points.hpp"
#include "import_listener.hpp"
#include "journey_import.hpp"
#include "kv_store.hpp"
#include "staging_channel.hpp"
#include "wake_signal.hpp"

#include <httplib.h>
#ifdef JOURNEY_HANDOFF_WITH_MONGO
#include "mongo_kv_store.hpp"
#endif

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::unique_ptr<IKeyValueStore> make_store(const AppConfig& cfg)
{
#ifdef JOURNEY_HANDOFF_WITH_MONGO
    if (!cfg.mongo_uri.empty())
        return std::make_unique<MongoKeyValueStore>(cfg.mongo_uri, cfg.keys.group_id);
#endif
    return std::make_unique<FileKeyValueStore>(cfg.shared_dir, cfg.keys.group_id);
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void print_usage()
{
    std::cerr << "usage: journey-handoff preview <file>\n"
                 "       journey-handoff share <file>\n"
                 "       journey-handoff open <file>\n"
                 "       journey-handoff take\n"
                 "       journey-handoff listen\n";
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void print_imported(const ImportedJourney& j)
{
    std::cout << "Add Friend? " << j.sender_name << " wants to share their journey ("
              << j.journey.total_locations << " locations)\n";
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static int run_listen(const AppConfig& cfg, StagingChannel& channel)
{
    httplib::Server svr;
    configure_import_routes(svr, channel, print_imported);

    // covers wakes that never arrived
    ImportPoller const poller(channel, print_imported, cfg.poll_seconds);

    std::cout << "[journey-handoff] listening on " << cfg.listen_host << ":" << cfg.listen_port << '\n';
    if (!svr.listen(cfg.listen_host, cfg.listen_port))
    {
        std::cerr << "[journey-handoff] cannot bind " << cfg.listen_host << ":" << cfg.listen_port << '\n';
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage();
        return EXIT_FAILURE;
    }
    const std::string cmd = argv[1];
    const bool        needs_file = cmd == "preview" || cmd == "share" || cmd == "open";
    if (needs_file && argc < 3)
    {
        print_usage();
        return EXIT_FAILURE;
    }

    try
    {
        const auto cfg = load_config_from_env();

        if (cmd == "preview")
        {
            const auto s = preview_file(argv[2], cfg.utc_offset_minutes);
            std::cout << s.sender_name << "\nwants to share their journey\n" << s.location_count << " locations\n";
            if (s.date_range_text)
                std::cout << *s.date_range_text << '\n';
            return EXIT_SUCCESS;
        }

        auto           store = make_store(cfg);
        HttpWakeSignal wake(cfg.wake_host, cfg.wake_port);
        StagingChannel channel(*store, &wake, cfg.keys);

        if (cmd == "share" || cmd == "open")
        {
            const auto out = cmd == "share" ? share_file(argv[2], channel) : open_in_app(argv[2], channel);
            std::cout << "Opening Mapped: your friend's journey is being imported!\n";
            if (!out.wake_delivered)
                std::cout << user_message(HandoffErrorKind::WakeFailed) << '\n';
            return EXIT_SUCCESS;
        }
        if (cmd == "take")
        {
            if (!import_staged(channel, print_imported))
                std::cout << "No pending import\n";
            return EXIT_SUCCESS;
        }
        if (cmd == "listen")
            return run_listen(cfg, channel);

        print_usage();
        return EXIT_FAILURE;
    }
    catch (const HandoffError& ex)
    {
        std::cerr << "[journey-handoff] " << error_kind_name(ex.kind()) << ": " << ex.what() << '\n';
        std::cout << "Cannot Import: " << user_message(ex.kind()) << '\n';
        return EXIT_FAILURE;
    }
    catch (const std::exception& ex)
    {
        std::cerr << "Fatal error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}

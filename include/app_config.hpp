#pragma once
#include "staging_channel.hpp"

#include <filesystem>
#include <string>

struct AppConfig
{
    StagingKeys           keys;
    std::filesystem::path shared_dir;        // root of the file-backed shared store
    std::string           mongo_uri;         // non-empty selects the Mongo store (when built with it)
    std::string           listen_host = "127.0.0.1";
    int                   listen_port = 8765;
    std::string           wake_host;         // defaults to listen_host
    int                   wake_port   = 0;   // defaults to listen_port
    int                   poll_seconds       = 5;
    int                   utc_offset_minutes = 0;
};

// Reads JOURNEY_HANDOFF_GROUP, JOURNEY_HANDOFF_SHARED_DIR, MONGO_URI, HOST, PORT, WAKE_HOST,
// WAKE_PORT, JOURNEY_HANDOFF_POLL_SECONDS and JOURNEY_HANDOFF_UTC_OFFSET_MINUTES.
// Throws std::runtime_error naming the variable when a number does not parse.
AppConfig load_config_from_env();

#include "app_config.hpp"

#include <cstdlib>
#include <stdexcept>

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string env_or(const char* name, const std::string& fallback)
{
    const char* v = std::getenv(name);
    return (v != nullptr && *v != '\0') ? std::string(v) : fallback;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static int env_int_or(const char* name, int fallback)
{
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0')
        return fallback;
    try
    {
        std::size_t used  = 0;
        const int   value = std::stoi(v, &used);
        if (used != std::string(v).size())
            throw std::invalid_argument("trailing characters");
        return value;
    }
    catch (const std::exception&)
    {
        throw std::runtime_error(std::string(name) + " is not an integer: '" + v + "'");
    }
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::filesystem::path default_shared_dir()
{
    if (const char* runtime = std::getenv("XDG_RUNTIME_DIR"); runtime != nullptr && *runtime != '\0')
        return std::filesystem::path(runtime) / "journey-handoff";
    return std::filesystem::path("/tmp") / "journey-handoff";
}

AppConfig load_config_from_env()
{
    AppConfig cfg;
    cfg.keys.group_id = env_or("JOURNEY_HANDOFF_GROUP", cfg.keys.group_id);

    const char* dir = std::getenv("JOURNEY_HANDOFF_SHARED_DIR");
    cfg.shared_dir  = (dir != nullptr && *dir != '\0') ? std::filesystem::path(dir) : default_shared_dir();

    cfg.mongo_uri   = env_or("MONGO_URI", "");
    cfg.listen_host = env_or("HOST", cfg.listen_host);
    cfg.listen_port = env_int_or("PORT", cfg.listen_port);
    cfg.wake_host   = env_or("WAKE_HOST", cfg.listen_host);
    cfg.wake_port   = env_int_or("WAKE_PORT", cfg.listen_port);

    cfg.poll_seconds       = env_int_or("JOURNEY_HANDOFF_POLL_SECONDS", cfg.poll_seconds);
    cfg.utc_offset_minutes = env_int_or("JOURNEY_HANDOFF_UTC_OFFSET_MINUTES", cfg.utc_offset_minutes);

    if (cfg.listen_port <= 0 || cfg.listen_port > 65535)
        throw std::runtime_error("PORT out of range: " + std::to_string(cfg.listen_port));
    if (cfg.wake_port <= 0 || cfg.wake_port > 65535)
        throw std::runtime_error("WAKE_PORT out of range: " + std::to_string(cfg.wake_port));
    return cfg;
}

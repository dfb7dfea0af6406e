#pragma once
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct JourneyLocation
{
    double       latitude  = 0.0;
    double       longitude = 0.0;
    std::int64_t timestamp = 0; // epoch seconds
};

struct JourneyDateRange
{
    std::int64_t earliest = 0; // epoch seconds
    std::int64_t latest   = 0;
};

/**
 * Versioned journey export as written by the exporter.
 * total_locations is expected to equal locations.size() but nothing enforces it,
 * and the locations are not re-sorted on read.
 */
struct JourneyExport
{
    std::vector<JourneyLocation>    locations;
    std::int64_t                    export_date     = 0;
    std::int64_t                    total_locations = 0;
    std::optional<JourneyDateRange> date_range; // absent when there are no locations
};

// Wrapping variant carrying the free-form sender name.
struct ShareableJourneyExport
{
    std::string   sender_name;
    JourneyExport export_data;
};

// ISO-8601 internet date-time <-> epoch seconds.
// Implemented in src/iso8601.cpp
std::int64_t parse_iso8601(const std::string& text);
std::string  format_iso8601(std::int64_t epoch_seconds);

// Medium en_US date ("Jan 5, 2025") for the given offset from UTC.
std::string format_medium_date(std::int64_t epoch_seconds, int utc_offset_minutes = 0);

// JSON mapping. Readers throw nlohmann::json::exception or std::runtime_error on
// missing keys, wrong types and bad timestamps. Implemented in src/journey_model.cpp
JourneyExport          journey_export_from_json(const nlohmann::json& j);
ShareableJourneyExport shareable_export_from_json(const nlohmann::json& j);
nlohmann::json         journey_export_to_json(const JourneyExport& e);
nlohmann::json         shareable_export_to_json(const ShareableJourneyExport& s);

// Builds an export from raw samples: counts them and derives the date range.
JourneyExport make_journey_export(std::vector<JourneyLocation> locations, std::int64_t export_date);

#include "journey_model.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static void require_object(const json& j, const char* what)
{
    if (!j.is_object())
        throw std::runtime_error(std::string(what) + " must be a JSON object");
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static double number_field(const json& j, const char* key)
{
    const auto& v = j.at(key);
    // json::get<double>() would also accept booleans
    if (!v.is_number())
        throw std::runtime_error(std::string(key) + " must be a number");
    return v.get<double>();
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::int64_t integer_field(const json& j, const char* key)
{
    const auto& v = j.at(key);
    if (!v.is_number_integer())
        throw std::runtime_error(std::string(key) + " must be an integer");
    if (v.is_number_unsigned() &&
        v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        throw std::runtime_error(std::string(key) + " is out of range");
    return v.get<std::int64_t>();
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::int64_t date_field(const json& j, const char* key)
{
    return parse_iso8601(j.at(key).get<std::string>());
}

JourneyExport journey_export_from_json(const json& j)
{
    require_object(j, "journey export");

    const auto& locs = j.at("locations");
    if (!locs.is_array())
        throw std::runtime_error("locations must be a JSON array");

    JourneyExport e;
    e.locations.reserve(locs.size());
    for (const auto& item : locs)
    {
        require_object(item, "location");
        JourneyLocation loc;
        loc.latitude  = number_field(item, "latitude");
        loc.longitude = number_field(item, "longitude");
        loc.timestamp = date_field(item, "timestamp");
        e.locations.push_back(loc);
    }

    e.export_date     = date_field(j, "exportDate");
    e.total_locations = integer_field(j, "totalLocations");

    // Missing and null both mean "no range"
    auto it = j.find("dateRange");
    if (it != j.end() && !it->is_null())
    {
        require_object(*it, "dateRange");
        JourneyDateRange r;
        r.earliest   = date_field(*it, "earliest");
        r.latest     = date_field(*it, "latest");
        e.date_range = r;
    }
    return e;
}

ShareableJourneyExport shareable_export_from_json(const json& j)
{
    require_object(j, "shareable journey");

    ShareableJourneyExport s;
    s.sender_name = j.at("senderName").get<std::string>();
    s.export_data = journey_export_from_json(j.at("exportData"));
    return s;
}

json journey_export_to_json(const JourneyExport& e)
{
    json locs = json::array();
    for (const auto& l : e.locations)
        locs.push_back({ { "latitude", l.latitude },
                         { "longitude", l.longitude },
                         { "timestamp", format_iso8601(l.timestamp) } });

    json out = { { "locations", locs },
                 { "exportDate", format_iso8601(e.export_date) },
                 { "totalLocations", e.total_locations } };
    if (e.date_range)
        out["dateRange"] = { { "earliest", format_iso8601(e.date_range->earliest) },
                             { "latest", format_iso8601(e.date_range->latest) } };
    return out;
}

json shareable_export_to_json(const ShareableJourneyExport& s)
{
    return { { "senderName", s.sender_name }, { "exportData", journey_export_to_json(s.export_data) } };
}

JourneyExport make_journey_export(std::vector<JourneyLocation> locations, std::int64_t export_date)
{
    JourneyExport e;
    e.export_date     = export_date;
    e.total_locations = static_cast<std::int64_t>(locations.size());
    if (!locations.empty())
    {
        const auto [lo, hi] = std::minmax_element(locations.begin(), locations.end(),
                                                  [](const JourneyLocation& a, const JourneyLocation& b)
                                                  { return a.timestamp < b.timestamp; });
        e.date_range        = JourneyDateRange{ lo->timestamp, hi->timestamp };
    }
    e.locations = std::move(locations);
    return e;
}

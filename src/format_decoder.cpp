#include "format_decoder.hpp"

#include <cctype>
#include <functional>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using nlohmann::json;

namespace
{

using DecodeFn = std::function<DecodedJourney(const json&)>;

// Closed, ordered set of schema attempts. The first one that does not throw wins.
const std::vector<std::pair<SchemaTag, DecodeFn>>& schema_attempts()
{
    static const std::vector<std::pair<SchemaTag, DecodeFn>> kAttempts = {
        { SchemaTag::Shareable,
          [](const json& j)
          {
              auto s = shareable_export_from_json(j);
              return DecodedJourney{ SchemaTag::Shareable, std::move(s.sender_name), std::move(s.export_data) };
          } },
        { SchemaTag::Legacy,
          [](const json& j) { return DecodedJourney{ SchemaTag::Legacy, kDefaultSenderName, journey_export_from_json(j) }; } },
    };
    return kAttempts;
}

} // namespace

const char* schema_tag_name(SchemaTag tag)
{
    switch (tag)
    {
    case SchemaTag::Shareable:
        return "shareable";
    case SchemaTag::Legacy:
        return "legacy";
    }
    return "unknown";
}

std::string_view strip_magic_header(std::string_view bytes)
{
    for (const auto& header : magic_headers())
    {
        if (bytes.substr(0, header.size()) == header)
            return bytes.substr(header.size());
    }
    return bytes;
}

DecodedJourney decode_journey(std::string_view bytes)
{
    return decode_journey_payload(strip_magic_header(bytes));
}

DecodedJourney decode_journey_payload(std::string_view payload)
{
    const json doc = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (doc.is_discarded())
        throw HandoffError(HandoffErrorKind::NotAJourneyFile, "payload is not valid JSON");

    std::string last_error;
    for (const auto& [tag, decode] : schema_attempts())
    {
        try
        {
            return decode(doc);
        }
        catch (const json::exception& e)
        {
            last_error = std::string(schema_tag_name(tag)) + ": " + e.what();
        }
        catch (const std::runtime_error& e)
        {
            last_error = std::string(schema_tag_name(tag)) + ": " + e.what();
        }
    }
    throw HandoffError(HandoffErrorKind::NotAJourneyFile, "no journey schema matched (" + last_error + ")");
}

JourneySummary summarize(const DecodedJourney& decoded, int utc_offset_minutes)
{
    JourneySummary s;
    s.sender_name    = decoded.sender_name;
    s.location_count = decoded.journey.total_locations;
    if (const auto& range = decoded.journey.date_range)
        s.date_range_text = format_medium_date(range->earliest, utc_offset_minutes) + " - " +
                            format_medium_date(range->latest, utc_offset_minutes);
    return s;
}

JourneySummary decode_summary(std::string_view bytes, int utc_offset_minutes)
{
    return summarize(decode_journey(bytes), utc_offset_minutes);
}

std::string encode_journey_file(const ShareableJourneyExport& shareable)
{
    return current_magic_header() + shareable_export_to_json(shareable).dump(2);
}

std::string make_share_filename(const std::string& sender_name)
{
    std::string out;
    out.reserve(sender_name.size() + 16);
    for (const char c : sender_name)
    {
        if (c == ' ')
            out.push_back('_');
        else if (std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_')
            out.push_back(c);
    }
    return out + "_Journey.mapped";
}

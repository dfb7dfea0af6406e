#pragma once
#include "handoff_error.hpp"
#include "journey_model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Recognised magic headers, in the order they are checked. None is a prefix of another.
inline const std::vector<std::string>& magic_headers()
{
    static const std::vector<std::string> kHeaders = { "MAPPED_JOURNEY_FILE\n", "MAPPED_JOURNEY_V1\n" };
    return kHeaders;
}

// Header written by the current exporter.
inline const std::string& current_magic_header()
{
    return magic_headers()[1];
}

inline const char* const kDefaultSenderName = "Friend";

enum class SchemaTag
{
    Shareable, // {"senderName", "exportData"}
    Legacy     // bare journey export
};

const char* schema_tag_name(SchemaTag tag);

struct DecodedJourney
{
    SchemaTag     schema = SchemaTag::Legacy;
    std::string   sender_name;
    JourneyExport journey;
};

// What a preview shows.
struct JourneySummary
{
    std::string                sender_name;
    std::int64_t               location_count = 0; // totalLocations as written, not recounted
    std::optional<std::string> date_range_text;    // "<earliest> - <latest>"
};

// Removes the first matching magic header, or returns bytes unchanged.
std::string_view strip_magic_header(std::string_view bytes);

/**
 * Decodes a journey file: strips the magic header, then tries each schema in order
 * (shareable first, legacy second) and keeps the first that deserializes.
 * Field values are not sanity checked; decode success is the only gate.
 *
 * @throws HandoffError{NotAJourneyFile} when no schema matches
 */
DecodedJourney decode_journey(std::string_view bytes);

// Same tiered decode for a payload whose header has already been removed.
DecodedJourney decode_journey_payload(std::string_view json_bytes);

JourneySummary summarize(const DecodedJourney& decoded, int utc_offset_minutes = 0);

// decode_journey + summarize
JourneySummary decode_summary(std::string_view bytes, int utc_offset_minutes = 0);

// Writer side: current header followed by the shareable JSON.
std::string encode_journey_file(const ShareableJourneyExport& shareable);

// "Alex Smith" -> "Alex_Smith_Journey.mapped"
std::string make_share_filename(const std::string& sender_name);

#pragma once
#include "format_decoder.hpp"
#include "staging_channel.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// A journey accepted by the consuming application, ready for its own import.
struct ImportedJourney
{
    std::string    filename;
    std::string    sender_name;
    SchemaTag      schema = SchemaTag::Legacy;
    JourneyExport  journey;
    std::string    export_json; // bare journey export, re-encoded
};

using ImportHandler = std::function<void(const ImportedJourney&)>;

// ".mapped", or a "*.mapped.json" name produced by messengers that rewrite extensions.
bool is_importable_filename(const std::string& filename);

/**
 * Consumer-side import of one file's bytes. For ".json" names a
 * {"_mapped_file": true, "_data": {...}} container is unwrapped first.
 *
 * @throws HandoffError{UnsupportedExtension} for other file names
 * @throws HandoffError{NotAJourneyFile} when neither schema matches
 */
ImportedJourney import_journey_bytes(std::string_view bytes, const std::string& filename);

// Takes the staged record (clearing the slot) and imports it.
// Returns std::nullopt when nothing is staged. The handler runs only on success.
std::optional<ImportedJourney> import_staged(StagingChannel& channel, const ImportHandler& handler);

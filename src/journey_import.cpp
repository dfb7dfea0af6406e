#include "journey_import.hpp"

#include "entry_points.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <nlohmann/json.hpp>

using nlohmann::json;

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool is_importable_filename(const std::string& filename)
{
    if (has_extension(filename, ".mapped"))
        return true;
    return has_extension(filename, ".json") && to_lower(filename).find(".mapped.json") != std::string::npos;
}

ImportedJourney import_journey_bytes(std::string_view bytes, const std::string& filename)
{
    if (!is_importable_filename(filename))
        throw HandoffError(HandoffErrorKind::UnsupportedExtension, "not a mapped file: " + filename);

    std::string payload(strip_magic_header(bytes));

    if (has_extension(filename, ".json"))
    {
        const json wrapper = json::parse(payload, nullptr, false);
        if (wrapper.is_discarded())
        {
            std::cerr << "[journey-handoff] could not parse JSON container in " << filename << '\n';
        }
        else if (wrapper.is_object())
        {
            auto flag = wrapper.find("_mapped_file");
            auto data = wrapper.find("_data");
            if (flag != wrapper.end() && flag->is_boolean() && flag->get<bool>() && data != wrapper.end())
                payload = data->dump();
        }
    }

    auto decoded = decode_journey_payload(payload);

    ImportedJourney out;
    out.filename    = filename;
    out.sender_name = std::move(decoded.sender_name);
    out.schema      = decoded.schema;
    out.export_json = journey_export_to_json(decoded.journey).dump();
    out.journey     = std::move(decoded.journey);
    return out;
}

std::optional<ImportedJourney> import_staged(StagingChannel& channel, const ImportHandler& handler)
{
    auto rec = channel.take_staged();
    if (!rec)
        return std::nullopt;

    auto imported = import_journey_bytes(rec->payload, rec->filename);
    std::cout << "[journey-handoff] imported " << imported.journey.total_locations << " locations from "
              << imported.sender_name << " (" << schema_tag_name(imported.schema) << ")\n";
    if (handler)
        handler(imported);
    return imported;
}

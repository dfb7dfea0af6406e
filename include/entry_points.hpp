#pragma once
#include "format_decoder.hpp"
#include "staging_channel.hpp"

#include <filesystem>
#include <string>

// Reads the whole file. Throws HandoffError{UnreadableInput}.
std::string read_file_bytes(const std::filesystem::path& path);

// Case-insensitive check of the final extension, e.g. ".mapped".
bool has_extension(const std::string& filename, const std::string& ext);

// Preview host: any file name, decode success decides.
JourneySummary preview_file(const std::filesystem::path& path, int utc_offset_minutes = 0);

// Share host: only ".mapped" files are staged. Throws HandoffError{UnsupportedExtension,
// UnreadableInput, StoreUnavailable}.
StageOutcome share_file(const std::filesystem::path& path, StagingChannel& channel);

// Preview host's "open in app" action: stages the file as-is.
StageOutcome open_in_app(const std::filesystem::path& path, StagingChannel& channel);

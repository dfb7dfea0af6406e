#include "entry_points.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

std::string read_file_bytes(const std::filesystem::path& path)
{
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        throw HandoffError(HandoffErrorKind::UnreadableInput, path.string() + " is a directory");

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw HandoffError(HandoffErrorKind::UnreadableInput, "cannot open " + path.string());

    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad())
        throw HandoffError(HandoffErrorKind::UnreadableInput, "read error on " + path.string());
    return bytes;
}

bool has_extension(const std::string& filename, const std::string& ext)
{
    const auto actual = std::filesystem::path(filename).extension().string();
    if (actual.size() != ext.size())
        return false;
    return std::equal(actual.begin(), actual.end(), ext.begin(),
                      [](char a, char b)
                      {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

JourneySummary preview_file(const std::filesystem::path& path, int utc_offset_minutes)
{
    return decode_summary(read_file_bytes(path), utc_offset_minutes);
}

StageOutcome share_file(const std::filesystem::path& path, StagingChannel& channel)
{
    const auto filename = path.filename().string();
    if (!has_extension(filename, ".mapped"))
        throw HandoffError(HandoffErrorKind::UnsupportedExtension, "not a .mapped file: " + filename);

    return channel.stage(read_file_bytes(path), filename);
}

StageOutcome open_in_app(const std::filesystem::path& path, StagingChannel& channel)
{
    return channel.stage(read_file_bytes(path), path.filename().string());
}

#include "handoff_error.hpp"
#include "kv_store.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

// Group ids and keys become path components.
// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static bool is_safe_name(const std::string& s)
{
    if (s.empty() || s == "." || s == "..")
        return false;
    for (const char c : s)
    {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' ||
                        c == '_' || c == '-';
        if (!ok)
            return false;
    }
    return true;
}

// NOLINTNEXTLINE(misc-use-anonymous-namespace)
static std::string random_suffix()
{
    std::random_device                              rd;
    std::uniform_int_distribution<unsigned long long> dist;
    std::ostringstream                              oss;
    oss << std::hex << dist(rd);
    return oss.str();
}

FileKeyValueStore::FileKeyValueStore(const fs::path& root, const std::string& group_id)
{
    if (!is_safe_name(group_id))
        throw HandoffError(HandoffErrorKind::StoreUnavailable, "invalid sharing group id: '" + group_id + "'");

    dir_ = root / group_id;
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec || !fs::is_directory(dir_, ec))
        throw HandoffError(HandoffErrorKind::StoreUnavailable,
                           "cannot open shared store at " + dir_.string() + ": " + ec.message());
}

fs::path FileKeyValueStore::path_for(const std::string& key) const
{
    if (!is_safe_name(key))
        throw std::invalid_argument("invalid store key: '" + key + "'");
    return dir_ / key;
}

void FileKeyValueStore::set_string(const std::string& key, const std::string& value)
{
    const auto target = path_for(key);
    const auto tmp    = dir_ / ("." + key + ".tmp-" + random_suffix());

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
            throw HandoffError(HandoffErrorKind::StoreUnavailable, "cannot write " + tmp.string());
        out.write(value.data(), static_cast<std::streamsize>(value.size()));
        out.flush();
        if (!out)
        {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            throw HandoffError(HandoffErrorKind::StoreUnavailable, "short write to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw HandoffError(HandoffErrorKind::StoreUnavailable,
                           "cannot replace " + target.string() + ": " + ec.message());
    }
}

std::optional<std::string> FileKeyValueStore::get_string(const std::string& key) const
{
    const auto      p = path_for(key);
    std::error_code ec;
    if (!fs::exists(p, ec))
    {
        if (ec)
            throw HandoffError(HandoffErrorKind::StoreUnavailable, "cannot stat " + p.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream in(p, std::ios::binary);
    if (!in)
    {
        // removed between the exists() check and the open
        if (!fs::exists(p, ec))
            return std::nullopt;
        throw HandoffError(HandoffErrorKind::StoreUnavailable, "cannot read " + p.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void FileKeyValueStore::remove(const std::string& key)
{
    const auto      p = path_for(key);
    std::error_code ec;
    fs::remove(p, ec);
    if (ec)
        throw HandoffError(HandoffErrorKind::StoreUnavailable, "cannot remove " + p.string() + ": " + ec.message());
}

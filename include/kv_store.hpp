#pragma once
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * Key-value namespace shared between the staging side and the consuming side.
 * Each single-key write is atomic; nothing is atomic across keys, so a reader racing
 * a writer can see a new value under one key paired with an old value under another.
 * Implementations throw HandoffError{StoreUnavailable} when the backing storage fails.
 */
struct IKeyValueStore
{
    virtual ~IKeyValueStore() = default;

    virtual void                       set_string(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_string(const std::string& key) const                     = 0;
    virtual void                       remove(const std::string& key)                               = 0;
};

class InMemoryKeyValueStore : public IKeyValueStore
{
  public:
    void set_string(const std::string& key, const std::string& value) override
    {
        std::scoped_lock lk(mu_);
        values_[key] = value;
    }

    std::optional<std::string> get_string(const std::string& key) const override
    {
        std::scoped_lock lk(mu_);
        auto             it = values_.find(key);
        if (it == values_.end())
            return std::nullopt;
        return it->second;
    }

    void remove(const std::string& key) override
    {
        std::scoped_lock lk(mu_);
        values_.erase(key);
    }

    std::size_t size() const
    {
        std::scoped_lock lk(mu_);
        return values_.size();
    }

  private:
    mutable std::mutex                           mu_;
    std::unordered_map<std::string, std::string> values_;
};

// Directory-backed store visible to every process on the host: <root>/<group_id>/<key>.
// Values are replaced with write-to-temp + rename. Implemented in src/file_kv_store.cpp
class FileKeyValueStore : public IKeyValueStore
{
  public:
    // Throws HandoffError{StoreUnavailable} for an invalid group id or an unusable directory.
    FileKeyValueStore(const std::filesystem::path& root, const std::string& group_id);

    void                       set_string(const std::string& key, const std::string& value) override;
    std::optional<std::string> get_string(const std::string& key) const override;
    void                       remove(const std::string& key) override;

    const std::filesystem::path& directory() const
    {
        return dir_;
    }

  private:
    std::filesystem::path path_for(const std::string& key) const;

    std::filesystem::path dir_;
};

#pragma once
#include "kv_store.hpp"
#include "wake_signal.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Well-known names shared by the staging side and the consuming side.
struct StagingKeys
{
    std::string group_id         = "group.com.novalco.mapped";
    std::string payload_key      = "pendingImportData";
    std::string filename_key     = "pendingImportFilename";
    std::string wake_uri         = "mapped://import";
    std::string default_filename = "import.mapped";
};

struct StagedRecord
{
    std::string payload; // raw bytes, not re-validated
    std::string filename;
};

struct StageOutcome
{
    std::size_t bytes_staged   = 0;
    bool        wake_delivered = false;
};

/**
 * Single-slot handoff between a short-lived producer and a long-lived consumer.
 *
 * stage() always replaces whatever is in the slot: a record that was staged but never
 * taken is silently lost. take_staged() clears the slot after a successful read, so a
 * record is consumed at most once. The slot is read again before it is cleared, and a
 * record restaged in between is taken instead of being deleted unread.
 */
class StagingChannel
{
  public:
    // wake may be null; the consumer then relies on polling.
    StagingChannel(IKeyValueStore& store, IWakeSignal* wake, StagingKeys keys = {});

    // Throws HandoffError{StoreUnavailable}. A failed wake is logged, not thrown.
    StageOutcome stage(std::string_view payload, const std::string& filename);

    // std::nullopt when the slot is empty or the payload is not valid base64.
    // Throws HandoffError{StoreUnavailable}.
    std::optional<StagedRecord> take_staged();

    bool has_pending() const;

    const StagingKeys& keys() const
    {
        return keys_;
    }

  private:
    // payload, filename; filename is not read when the payload is absent
    using Slot = std::pair<std::optional<std::string>, std::optional<std::string>>;

    Slot read_slot() const;

    IKeyValueStore& store_;
    IWakeSignal*    wake_;
    StagingKeys     keys_;
    std::mutex      take_mu_; // serializes in-process consumers only
};

#include "staging_channel.hpp"

#include "base64.hpp"
#include "handoff_error.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

StagingChannel::StagingChannel(IKeyValueStore& store, IWakeSignal* wake, StagingKeys keys)
    : store_(store), wake_(wake), keys_(std::move(keys))
{
}

StageOutcome StagingChannel::stage(std::string_view payload, const std::string& filename)
{
    const auto encoded = base64_encode(payload);
    try
    {
        // payload first: a consumer that sees the new filename also finds a payload
        store_.set_string(keys_.payload_key, encoded);
        store_.set_string(keys_.filename_key, filename);
    }
    catch (const HandoffError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("staging write failed: ") + e.what());
    }

    StageOutcome out;
    out.bytes_staged = payload.size();
    std::cout << "[journey-handoff] staged " << out.bytes_staged << " bytes as '" << filename << "'\n";

    out.wake_delivered = wake_ != nullptr && wake_->wake(keys_.wake_uri);
    if (!out.wake_delivered)
        std::cerr << "[journey-handoff] " << error_kind_name(HandoffErrorKind::WakeFailed) << ": could not signal "
                  << keys_.wake_uri << ", data stays staged\n";
    return out;
}

StagingChannel::Slot StagingChannel::read_slot() const
{
    try
    {
        Slot slot;
        slot.first = store_.get_string(keys_.payload_key);
        if (slot.first)
            slot.second = store_.get_string(keys_.filename_key);
        return slot;
    }
    catch (const HandoffError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("staging read failed: ") + e.what());
    }
}

std::optional<StagedRecord> StagingChannel::take_staged()
{
    std::scoped_lock lk(take_mu_);

    for (;;)
    {
        auto slot = read_slot();
        if (!slot.first)
            return std::nullopt;

        auto payload = base64_decode(*slot.first);
        if (!payload)
        {
            std::cerr << "[journey-handoff] staged payload is not valid base64, leaving it in place\n";
            return std::nullopt;
        }

        // a producer may have restaged while we were reading; only clear what we hold
        if (read_slot() != slot)
        {
            std::cout << "[journey-handoff] slot restaged during take, reading again\n";
            continue;
        }

        StagedRecord rec{ std::move(*payload), slot.second ? std::move(*slot.second) : keys_.default_filename };

        try
        {
            store_.remove(keys_.payload_key);
            store_.remove(keys_.filename_key);
        }
        catch (const HandoffError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("staging clear failed: ") + e.what());
        }

        std::cout << "[journey-handoff] took staged '" << rec.filename << "' (" << rec.payload.size() << " bytes)\n";
        return rec;
    }
}

bool StagingChannel::has_pending() const
{
    try
    {
        return store_.get_string(keys_.payload_key).has_value();
    }
    catch (const HandoffError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw HandoffError(HandoffErrorKind::StoreUnavailable, std::string("staging read failed: ") + e.what());
    }
}

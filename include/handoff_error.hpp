#pragma once
#include <stdexcept>
#include <string>

enum class HandoffErrorKind
{
    UnreadableInput,
    NotAJourneyFile,
    StoreUnavailable,
    WakeFailed,
    UnsupportedExtension
};

// Every failure surfaced by the decoder, the staging channel and the entry points.
// None of them is retried: inputs are static byte blobs.
class HandoffError : public std::runtime_error
{
  public:
    HandoffError(HandoffErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind)
    {
    }

    HandoffErrorKind kind() const noexcept
    {
        return kind_;
    }

  private:
    HandoffErrorKind kind_;
};

// Stable identifier, used in logs and JSON responses ("not_a_journey_file", ...)
const char* error_kind_name(HandoffErrorKind kind);

// Text shown to the user in place of the internal error.
std::string user_message(HandoffErrorKind kind);

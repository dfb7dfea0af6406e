#include "handoff_error.hpp"

const char* error_kind_name(HandoffErrorKind kind)
{
    switch (kind)
    {
    case HandoffErrorKind::UnreadableInput:
        return "unreadable_input";
    case HandoffErrorKind::NotAJourneyFile:
        return "not_a_journey_file";
    case HandoffErrorKind::StoreUnavailable:
        return "store_unavailable";
    case HandoffErrorKind::WakeFailed:
        return "wake_failed";
    case HandoffErrorKind::UnsupportedExtension:
        return "unsupported_extension";
    }
    return "unknown";
}

std::string user_message(HandoffErrorKind kind)
{
    switch (kind)
    {
    case HandoffErrorKind::UnreadableInput:
        return "Could not read file";
    case HandoffErrorKind::NotAJourneyFile:
        return "Not a valid Mapped journey file";
    case HandoffErrorKind::StoreUnavailable:
        return "Could not access app storage";
    case HandoffErrorKind::WakeFailed:
        return "Your journey was saved. Open Mapped to finish importing";
    case HandoffErrorKind::UnsupportedExtension:
        return "Please select a .mapped file";
    }
    return "Something went wrong";
}

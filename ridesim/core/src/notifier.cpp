#include <ridesim/core/notifier.hpp>

namespace ridesim::core {

std::string_view to_string(ActorKind kind) noexcept {
    switch (kind) {
        case ActorKind::Rider:  return "rider";
        case ActorKind::Driver: return "driver";
    }
    return "unknown";
}

std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::Request: return "request";
        case Action::Cancel:  return "cancel";
        case Action::Pickup:  return "pickup";
        case Action::Dropoff: return "dropoff";
    }
    return "unknown";
}

} // namespace ridesim::core

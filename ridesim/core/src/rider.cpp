#include <ridesim/core/rider.hpp>
#include <ridesim/core/error.hpp>

#include <utility>

namespace ridesim::core {

std::string_view to_string(RiderStatus status) noexcept {
    switch (status) {
        case RiderStatus::Waiting:   return "waiting";
        case RiderStatus::Cancelled: return "cancelled";
        case RiderStatus::Satisfied: return "satisfied";
    }
    return "unknown";
}

Rider::Rider(std::string id, Location origin, Location destination, Duration patience)
    : id_(std::move(id))
    , origin_(origin)
    , destination_(destination)
    , patience_(patience) {}

void Rider::cancel() {
    if (status_ == RiderStatus::Satisfied) {
        throw InvalidStateError("Rider " + id_ + " was already picked up and cannot cancel");
    }
    status_ = RiderStatus::Cancelled;
}

void Rider::satisfy() {
    if (status_ == RiderStatus::Cancelled) {
        throw InvalidStateError("Rider " + id_ + " has cancelled and cannot be picked up");
    }
    status_ = RiderStatus::Satisfied;
}

std::ostream& operator<<(std::ostream& os, const Rider& rider) {
    return os << "ID: " << rider.id()
              << ", Origin: " << rider.origin()
              << ", Destination: " << rider.destination()
              << ", Status: " << to_string(rider.status())
              << ", Patience: " << rider.patience();
}

} // namespace ridesim::core

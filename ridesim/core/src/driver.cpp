#include <ridesim/core/driver.hpp>
#include <ridesim/core/error.hpp>
#include <ridesim/core/rider.hpp>

#include <utility>

namespace ridesim::core {

Driver::Driver(std::string id, Location location, Speed speed)
    : id_(std::move(id))
    , location_(location)
    , speed_(speed) {}

Duration Driver::travel_time(Location to) const noexcept {
    return core::travel_time(location_, to, speed_);
}

Duration Driver::start_drive(Location to) {
    if (!idle_) {
        throw InvalidStateError("Driver " + id_ + " is already en route");
    }
    idle_ = false;
    destination_ = to;
    return travel_time(to);
}

void Driver::end_drive() {
    if (!destination_) {
        throw InvalidStateError("Driver " + id_ + " has no pickup to arrive at");
    }
    location_ = *destination_;
    destination_.reset();
}

Duration Driver::start_ride(const Rider& rider) {
    if (!engaged_at_pickup()) {
        throw InvalidStateError("Driver " + id_ + " is not waiting at a pickup");
    }
    destination_ = rider.destination();
    return travel_time(rider.destination());
}

void Driver::end_ride() {
    if (!destination_) {
        throw InvalidStateError("Driver " + id_ + " has no dropoff to arrive at");
    }
    location_ = *destination_;
    destination_.reset();
    idle_ = true;
}

void Driver::release() {
    if (!engaged_at_pickup()) {
        throw InvalidStateError("Driver " + id_ + " is not waiting at a pickup");
    }
    idle_ = true;
}

std::ostream& operator<<(std::ostream& os, const Driver& driver) {
    return os << "ID: " << driver.id()
              << ", Location: " << driver.location()
              << ", Speed: " << driver.speed();
}

} // namespace ridesim::core

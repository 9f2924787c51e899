#include <ridesim/core/dispatcher.hpp>
#include <ridesim/core/driver.hpp>
#include <ridesim/core/rider.hpp>

#include <algorithm>

namespace ridesim::core {

namespace {

template<typename Range>
void write_list(std::ostream& os, const Range& ids) {
    os << '[';
    bool first = true;
    for (const auto& id : ids) {
        if (!first) {
            os << ", ";
        }
        os << id;
        first = false;
    }
    os << ']';
}

std::vector<std::string> sorted(const std::unordered_set<std::string>& ids) {
    std::vector<std::string> result(ids.begin(), ids.end());
    std::sort(result.begin(), result.end());
    return result;
}

} // anonymous namespace

Dispatcher::Dispatcher(MatchPolicy policy)
    : policy_(policy) {}

Driver* Dispatcher::request_driver(Rider& rider) {
    if (!waiting_index_.contains(rider.id())) {
        auto it = waiting_.insert(waiting_.end(), &rider);
        waiting_index_.emplace(rider.id(), it);
    }

    Driver* best = nullptr;
    Duration best_time = 0;
    for (Driver* driver : idle_) {
        Duration eta = driver->travel_time(rider.origin());
        // Strict comparison keeps the earliest idle driver on ties
        if (best == nullptr || eta < best_time) {
            best = driver;
            best_time = eta;
        }
    }

    if (best != nullptr && policy_ == MatchPolicy::Reserve) {
        remove_idle(*best);
    }
    return best;
}

Rider* Dispatcher::request_rider(Driver& driver) {
    bool is_new = drivers_.emplace(driver.id(), &driver).second;

    Rider* rider = waiting_.empty() ? nullptr : waiting_.front();

    switch (policy_) {
        case MatchPolicy::KeepIdle:
            if (is_new && driver.is_idle()) {
                idle_.push_back(&driver);
            }
            break;
        case MatchPolicy::Reserve:
            if (rider != nullptr || !driver.is_idle()) {
                remove_idle(driver);
            } else if (!is_idle(driver.id())) {
                idle_.push_back(&driver);
            }
            break;
    }

    return rider;
}

void Dispatcher::cancel_ride(const Rider& rider) {
    if (take_waiting(rider)) {
        cancelled_.insert(rider.id());
    }
}

void Dispatcher::end_successful_ride(const Rider& rider) {
    if (take_waiting(rider)) {
        satisfied_.insert(rider.id());
    }
}

bool Dispatcher::is_waiting(std::string_view rider_id) const {
    return waiting_index_.contains(std::string(rider_id));
}

bool Dispatcher::is_cancelled(std::string_view rider_id) const {
    return cancelled_.contains(std::string(rider_id));
}

bool Dispatcher::is_satisfied(std::string_view rider_id) const {
    return satisfied_.contains(std::string(rider_id));
}

bool Dispatcher::is_idle(std::string_view driver_id) const {
    return std::any_of(idle_.begin(), idle_.end(),
                       [driver_id](const Driver* d) { return d->id() == driver_id; });
}

bool Dispatcher::is_registered(std::string_view driver_id) const {
    return drivers_.contains(std::string(driver_id));
}

std::vector<std::string> Dispatcher::waiting_riders() const {
    std::vector<std::string> ids;
    ids.reserve(waiting_.size());
    for (const Rider* rider : waiting_) {
        ids.push_back(rider->id());
    }
    return ids;
}

std::vector<std::string> Dispatcher::idle_drivers() const {
    std::vector<std::string> ids;
    ids.reserve(idle_.size());
    for (const Driver* driver : idle_) {
        ids.push_back(driver->id());
    }
    return ids;
}

void Dispatcher::remove_idle(const Driver& driver) {
    std::erase_if(idle_, [&driver](const Driver* d) { return d->id() == driver.id(); });
}

bool Dispatcher::take_waiting(const Rider& rider) {
    auto it = waiting_index_.find(rider.id());
    if (it == waiting_index_.end()) {
        return false;
    }
    waiting_.erase(it->second);
    waiting_index_.erase(it);
    return true;
}

std::ostream& operator<<(std::ostream& os, const Dispatcher& dispatcher) {
    os << "rider's statuses:\n - waiting riders: ";
    write_list(os, dispatcher.waiting_riders());
    os << "\n - cancelled requests: ";
    write_list(os, sorted(dispatcher.cancelled_));
    os << "\n - satisfied riders: ";
    write_list(os, sorted(dispatcher.satisfied_));
    os << "\ndriver's statuses:\n - idle drivers: ";
    write_list(os, dispatcher.idle_drivers());
    os << "\n - total drivers: ";
    std::vector<std::string> total;
    total.reserve(dispatcher.drivers_.size());
    for (const auto& [id, driver] : dispatcher.drivers_) {
        total.push_back(id);
    }
    std::sort(total.begin(), total.end());
    write_list(os, total);
    return os;
}

} // namespace ridesim::core

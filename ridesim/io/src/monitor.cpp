#include <ridesim/io/monitor.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/writer.h>

namespace ridesim::io {

using core::Action;
using core::ActorKind;

void Monitor::notify(core::TimePoint time, ActorKind kind, Action action,
                     std::string_view id, core::Location location) {
    auto& entries = kind == ActorKind::Rider ? riders_ : drivers_;
    auto it = entries.find(id);
    if (it == entries.end()) {
        it = entries.emplace(std::string(id), std::vector<Activity>{}).first;
    }
    it->second.push_back({time, action, location});
}

const Monitor::ActivityLog& Monitor::log(ActorKind kind) const noexcept {
    return kind == ActorKind::Rider ? riders_ : drivers_;
}

const std::vector<Activity>& Monitor::activities(ActorKind kind, std::string_view id) const {
    static const std::vector<Activity> none;
    const auto& entries = log(kind);
    auto it = entries.find(id);
    return it == entries.end() ? none : it->second;
}

Report Monitor::report() const {
    Report result;

    // The first activity is the request, the second the pickup or cancellation
    uint64_t total_wait = 0;
    std::size_t waited = 0;
    for (const auto& [id, activities] : riders_) {
        if (activities.size() >= 2) {
            total_wait += activities[1].time - activities[0].time;
            ++waited;
        }
    }
    if (waited > 0) {
        result.rider_wait_time = static_cast<double>(total_wait) / static_cast<double>(waited);
    }

    uint64_t total_distance = 0;
    uint64_t ride_distance = 0;
    std::size_t moved = 0;
    for (const auto& [id, activities] : drivers_) {
        if (activities.size() < 2) {
            continue;
        }
        for (std::size_t i = 0; i + 1 < activities.size(); ++i) {
            uint64_t leg = core::manhattan_distance(activities[i].location, activities[i + 1].location);
            total_distance += leg;
            if (activities[i].action == Action::Pickup && activities[i + 1].action == Action::Dropoff) {
                ride_distance += leg;
            }
        }
        ++moved;
    }
    if (moved > 0) {
        result.driver_total_distance = static_cast<double>(total_distance) / static_cast<double>(moved);
    }
    // Averaged over every driver seen, including those that never drove anyone
    if (!drivers_.empty()) {
        result.driver_ride_distance = static_cast<double>(ride_distance) / static_cast<double>(drivers_.size());
    }

    return result;
}

std::ostream& operator<<(std::ostream& os, const Monitor& monitor) {
    return os << "Monitor (" << monitor.driver_count() << " drivers, "
              << monitor.rider_count() << " riders)";
}

namespace {

template<typename Writer>
void write_statistic(Writer& writer, const char* key, const std::optional<double>& value) {
    writer.Key(key);
    if (value) {
        writer.Double(*value);
    } else {
        writer.Null();
    }
}

} // anonymous namespace

void write_report_to_stream(const Report& report, std::ostream& out) {
    rapidjson::OStreamWrapper osw(out);
    rapidjson::Writer<rapidjson::OStreamWrapper> writer(osw);

    writer.StartObject();
    write_statistic(writer, "rider_wait_time", report.rider_wait_time);
    write_statistic(writer, "driver_total_distance", report.driver_total_distance);
    write_statistic(writer, "driver_ride_distance", report.driver_ride_distance);
    writer.EndObject();

    out << '\n';
}

} // namespace ridesim::io

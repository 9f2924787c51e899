#pragma once

#include <ridesim/core/dispatcher.hpp>
#include <ridesim/core/event.hpp>
#include <ridesim/core/event_queue.hpp>
#include <ridesim/core/trace_writer.hpp>
#include <ridesim/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ridesim::core {

class Driver;
class Notifier;
class Rider;

/// @brief Discrete-event simulation engine for ride matching.
///
/// The Engine is the central simulation loop. It owns the event queue,
/// the Dispatcher and every Rider and Driver taking part in the run, and
/// advances simulation time by applying events in timestamp order. Each
/// applied event may return follow-up events, which are enqueued as-is;
/// the run ends when the queue is empty.
///
/// The Engine is non-copyable and non-movable, designed for stack
/// allocation. A typical usage pattern is:
///
/// @code
/// io::Monitor monitor;
/// core::Engine engine(monitor);
/// auto& sam = engine.add_driver("Sam", {1, 1}, 2);
/// auto& xyz = engine.add_rider("xyz", {1, 1}, {6, 6}, 4);
/// engine.schedule_driver_request(sam, 0);
/// engine.schedule_rider_request(xyz, 1);
/// engine.run();
/// auto report = monitor.report();
/// @endcode
///
/// @see Dispatcher, EventQueue, Notifier, TraceWriter
/// @ingroup core_engine
class Engine {
public:
    /// @brief Create an engine reporting activities to @p notifier.
    /// @param notifier Receives every activity; must outlive the engine.
    /// @param policy   How the dispatcher treats matched drivers.
    explicit Engine(Notifier& notifier, MatchPolicy policy = MatchPolicy::Reserve);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(Engine&&) = delete;

    /// @brief Returns the current simulation time.
    [[nodiscard]] TimePoint time() const noexcept { return current_time_; }

    /// @brief Run the simulation until the event queue is empty.
    void run();

    /// @brief Run the simulation up to the given time.
    ///
    /// Events scheduled after @p until stay in the queue, and time is
    /// advanced to @p until.
    ///
    /// @param until Simulation stops after processing all events at this time.
    void run(TimePoint until);

    /// @brief Create a rider owned by the engine.
    /// @throws DuplicateIdError if a rider with @p id already exists.
    Rider& add_rider(std::string id, Location origin, Location destination, Duration patience);

    /// @brief Create a driver owned by the engine.
    /// @throws DuplicateIdError if a driver with @p id already exists.
    Driver& add_driver(std::string id, Location location, Speed speed);

    /// @brief Look up a rider by identifier, or nullptr.
    [[nodiscard]] Rider* find_rider(std::string_view id) const;

    /// @brief Look up a driver by identifier, or nullptr.
    [[nodiscard]] Driver* find_driver(std::string_view id) const;

    [[nodiscard]] std::size_t rider_count() const noexcept { return riders_.size(); }
    [[nodiscard]] std::size_t driver_count() const noexcept { return drivers_.size(); }

    /// @brief Insert an event into the event queue.
    /// @throws InvalidStateError if @p scheduled fires before time().
    void schedule(ScheduledEvent scheduled);

    /// @brief Schedule a RiderRequest for @p rider at @p when.
    void schedule_rider_request(Rider& rider, TimePoint when);

    /// @brief Schedule a DriverRequest for @p driver at @p when.
    void schedule_driver_request(Driver& driver, TimePoint when);

    /// @brief Number of events still queued.
    [[nodiscard]] std::size_t pending_events() const noexcept { return queue_.size(); }

    /// @brief Number of events applied so far.
    [[nodiscard]] uint64_t processed_events() const noexcept { return processed_events_; }

    [[nodiscard]] Dispatcher& dispatcher() noexcept { return dispatcher_; }
    [[nodiscard]] const Dispatcher& dispatcher() const noexcept { return dispatcher_; }

    /// @brief Set the trace writer for event logging.
    ///
    /// The Engine does not own the writer. Pass nullptr to disable tracing.
    void set_trace_writer(TraceWriter* writer) noexcept;

    /// @brief Invoke a tracing callback only if a trace writer is set.
    /// @tparam F Callable with signature void(TraceWriter&).
    template<typename F>
    void trace(F&& func);

private:
    void process_next_event();
    void trace_event(const ScheduledEvent& scheduled);

    TimePoint current_time_{0};
    uint64_t processed_events_{0};

    Notifier& notifier_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    Dispatcher dispatcher_;
    EventQueue queue_;
    TraceWriter* trace_writer_{nullptr};

    std::vector<std::unique_ptr<Rider>> riders_;
    std::vector<std::unique_ptr<Driver>> drivers_;
    std::unordered_map<std::string, Rider*> riders_by_id_;
    std::unordered_map<std::string, Driver*> drivers_by_id_;
};

// Template implementation
template<typename F>
void Engine::trace(F&& func) {
    if (trace_writer_) {
        trace_writer_->begin(current_time_);
        func(*trace_writer_);
        trace_writer_->end();
    }
}

} // namespace ridesim::core

/// @file launch_step.hpp
/// @brief Progress reporting: LaunchStep, LaunchEvent, ProgressChannel, StepTracker.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmit_cpp {

/// Lifecycle of a single launch step.
enum class StepStatus : std::uint8_t {
    pending,
    running,
    paused,     ///< Waiting on the user, e.g. for team selection.
    completed,
    failed,
};

/// Convert a StepStatus to its string representation.
constexpr auto to_string_view(StepStatus status) noexcept -> std::string_view {
    switch (status) {
        case StepStatus::pending:   return "pending";
        case StepStatus::running:   return "running";
        case StepStatus::paused:    return "paused";
        case StepStatus::completed: return "completed";
        case StepStatus::failed:    return "failed";
    }
    return "unknown";
}

/// One logical phase of a launch as shown to the user.
///
/// A step is mutated many times while it runs. Each mutation is published
/// as a full snapshot; consumers keep one row per title.
struct LaunchStep {
    using Clock = std::chrono::system_clock;

    std::string title;
    StepStatus status{StepStatus::pending};
    std::optional<std::string> message;
    std::vector<std::string> logs;
    Clock::time_point start_time{};
    std::optional<Clock::time_point> end_time;

    /// Time from start to end, or to now while the step is still open.
    auto duration() const -> std::chrono::milliseconds {
        auto end = end_time.value_or(Clock::now());
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - start_time);
    }

    auto operator==(const LaunchStep&) const -> bool = default;
};

/// A step snapshot.
struct StepEvent {
    LaunchStep step;
};

/// A chunk of output produced by the build task.
struct TaskOutputEvent {
    std::string task;
    std::string text;
};

/// Everything a publish reports to its caller, in order.
using LaunchEvent = std::variant<StepEvent, TaskOutputEvent>;

/// Ordered, thread-safe, closable queue of launch events.
///
/// The publisher pushes from its own thread; the host drains with pop()
/// until it returns nullopt, which happens once the channel is closed and
/// empty.
class ProgressChannel {
public:
    ProgressChannel() = default;
    ProgressChannel(const ProgressChannel&) = delete;
    auto operator=(const ProgressChannel&) -> ProgressChannel& = delete;

    /// Enqueue an event. Events pushed after close() are dropped.
    void push(LaunchEvent event);

    /// Block until an event is available or the channel is closed and drained.
    auto pop() -> std::optional<LaunchEvent>;

    /// Dequeue an event if one is ready. Never blocks.
    auto try_pop() -> std::optional<LaunchEvent>;

    /// Mark the end of the stream and wake blocked readers.
    void close();

    auto is_closed() const -> bool;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<LaunchEvent> events_;
    bool closed_{false};
};

/// Arena of steps for one launch plus the index of the active one.
///
/// Every mutation publishes a snapshot of the affected step to the channel.
/// Starting a step whose title already exists replaces that step rather than
/// appending a second row.
class StepTracker {
public:
    explicit StepTracker(ProgressChannel& channel) : channel_{channel} {}

    /// Start (or restart) the step with this title and make it active.
    void start(std::string title);

    /// Append a log line to the active step.
    void log(std::string line);

    /// Set the active step's human-readable message.
    void set_message(std::string message);

    /// Suspend the active step, e.g. while waiting for user input.
    void pause(std::string message);

    /// Return a paused step to running and clear its message.
    void resume();

    /// Finish the active step successfully.
    void complete(std::optional<std::string> message = std::nullopt);

    /// Finish the active step with a failure message. No-op without one.
    void fail(std::string message);

    /// Report build task output on the channel.
    void task_output(std::string task, std::string text);

    auto steps() const -> const std::vector<LaunchStep>& { return steps_; }
    auto active() const -> const LaunchStep*;
    auto has_active() const -> bool { return active_.has_value(); }

private:
    auto current() -> LaunchStep*;
    void publish(std::size_t index);

    ProgressChannel& channel_;
    std::vector<LaunchStep> steps_;
    std::optional<std::size_t> active_;
};

}  // namespace xmit_cpp

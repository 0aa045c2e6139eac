#include <xmit-cpp/launch_step.hpp>

#include <algorithm>

namespace xmit_cpp {

// -- ProgressChannel ----------------------------------------------------------

void ProgressChannel::push(LaunchEvent event) {
    {
        auto lock = std::scoped_lock{mutex_};
        if (closed_) return;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

auto ProgressChannel::pop() -> std::optional<LaunchEvent> {
    auto lock = std::unique_lock{mutex_};
    cv_.wait(lock, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

auto ProgressChannel::try_pop() -> std::optional<LaunchEvent> {
    auto lock = std::scoped_lock{mutex_};
    if (events_.empty()) return std::nullopt;
    auto event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void ProgressChannel::close() {
    {
        auto lock = std::scoped_lock{mutex_};
        closed_ = true;
    }
    cv_.notify_all();
}

auto ProgressChannel::is_closed() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return closed_;
}

// -- StepTracker --------------------------------------------------------------

void StepTracker::start(std::string title) {
    auto step = LaunchStep{};
    step.title = std::move(title);
    step.status = StepStatus::running;
    step.start_time = LaunchStep::Clock::now();

    auto it = std::find_if(steps_.rbegin(), steps_.rend(),
        [&](const LaunchStep& s) { return s.title == step.title; });
    if (it != steps_.rend()) {
        *it = std::move(step);
        active_ = static_cast<std::size_t>(std::distance(it, steps_.rend()) - 1);
    } else {
        steps_.push_back(std::move(step));
        active_ = steps_.size() - 1;
    }
    publish(*active_);
}

void StepTracker::log(std::string line) {
    auto* step = current();
    if (!step) return;
    step->logs.push_back(std::move(line));
    publish(*active_);
}

void StepTracker::set_message(std::string message) {
    auto* step = current();
    if (!step) return;
    step->message = std::move(message);
    publish(*active_);
}

void StepTracker::pause(std::string message) {
    auto* step = current();
    if (!step) return;
    step->status = StepStatus::paused;
    step->message = std::move(message);
    publish(*active_);
}

void StepTracker::resume() {
    auto* step = current();
    if (!step) return;
    step->status = StepStatus::running;
    step->message.reset();
    publish(*active_);
}

void StepTracker::complete(std::optional<std::string> message) {
    auto* step = current();
    if (!step) return;
    step->status = StepStatus::completed;
    if (message) step->message = std::move(*message);
    step->end_time = LaunchStep::Clock::now();
    publish(*active_);
    active_.reset();
}

void StepTracker::fail(std::string message) {
    auto* step = current();
    if (!step) return;
    step->status = StepStatus::failed;
    step->message = std::move(message);
    step->end_time = LaunchStep::Clock::now();
    publish(*active_);
    active_.reset();
}

void StepTracker::task_output(std::string task, std::string text) {
    channel_.push(TaskOutputEvent{std::move(task), std::move(text)});
}

auto StepTracker::active() const -> const LaunchStep* {
    if (!active_) return nullptr;
    return &steps_[*active_];
}

auto StepTracker::current() -> LaunchStep* {
    if (!active_) return nullptr;
    return &steps_[*active_];
}

void StepTracker::publish(std::size_t index) {
    channel_.push(StepEvent{steps_[index]});
}

}  // namespace xmit_cpp

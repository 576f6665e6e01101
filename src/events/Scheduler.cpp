#include "events/Scheduler.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace turntable::events {

void Scheduler::schedule(const std::string& name, std::chrono::milliseconds interval, Task task) {
    util::Logger::debug("Scheduler: Scheduling " + name + " every " + std::to_string(interval.count()) + "ms");
    tasks_[name] = {std::move(task), interval, Clock::now()};
}

void Scheduler::unschedule(const std::string& name) {
    util::Logger::debug("Scheduler: Unscheduling " + name);
    tasks_.erase(name);
}

void Scheduler::process() {
    process(Clock::now());
}

void Scheduler::process(Clock::time_point now) {
    for (auto& [name, task] : tasks_) {
        if (now - task.last_run >= task.interval) {
            task.task();
            task.last_run = now;
        }
    }
}

std::chrono::milliseconds Scheduler::time_until_next(Clock::time_point now,
                                                     std::chrono::milliseconds fallback) const {
    if (tasks_.empty()) return fallback;

    auto soonest = std::chrono::milliseconds::max();
    for (const auto& [name, task] : tasks_) {
        auto due = task.last_run + task.interval;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(due - now);
        soonest = std::min(soonest, remaining);
    }
    return std::max(soonest, std::chrono::milliseconds(0));
}

}  // namespace turntable::events

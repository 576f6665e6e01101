#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>

namespace turntable::events {

// Named periodic tasks driven by the host loop calling process().
class Scheduler {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    void schedule(const std::string& name, std::chrono::milliseconds interval, Task task);
    void unschedule(const std::string& name);

    void process();
    void process(Clock::time_point now);

    // Time until the earliest task is due; zero if one is overdue,
    // fallback when nothing is scheduled
    std::chrono::milliseconds time_until_next(Clock::time_point now,
                                              std::chrono::milliseconds fallback) const;

    size_t size() const { return tasks_.size(); }

private:
    struct ScheduledTask {
        Task task;
        std::chrono::milliseconds interval;
        Clock::time_point last_run;
    };

    std::map<std::string, ScheduledTask> tasks_;
};

}  // namespace turntable::events

#pragma once

namespace turntable::util {

// Wall-clock seconds used by PlaybackClock. Injected so tests can drive
// elapsed-time math without sleeping.
class TimeSource {
public:
    virtual ~TimeSource() = default;

    // Monotonic seconds since an arbitrary epoch. Never returns 0 in practice,
    // which PlaybackClock relies on for its "not paused" marker.
    virtual double now() const = 0;
};

class SystemTimeSource : public TimeSource {
public:
    double now() const override;
};

}  // namespace turntable::util

#pragma once

#include <string>

namespace turntable::backend {

// Best-effort track length estimator.
class DurationProbe {
public:
    virtual ~DurationProbe() = default;

    // Seconds, or 0.0 when the length cannot be determined. Never throws.
    virtual double probe(const std::string& path) = 0;
};

}  // namespace turntable::backend

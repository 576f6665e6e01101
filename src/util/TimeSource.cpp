#include "util/TimeSource.hpp"
#include <chrono>

namespace turntable::util {

double SystemTimeSource::now() const {
    auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

}  // namespace turntable::util

#include "pagebridge/util/clock.hpp"

#include <thread>

namespace pagebridge {

std::int64_t SystemClock::NowUnix() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void SystemClock::SleepFor(std::chrono::seconds d) {
    if (d.count() > 0) std::this_thread::sleep_for(d);
}

} // namespace pagebridge

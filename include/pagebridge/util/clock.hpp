#pragma once

#include <chrono>
#include <cstdint>

namespace pagebridge {

class IClock {
  public:
    virtual ~IClock() = default;
    virtual std::int64_t NowUnix() const = 0;
    virtual void SleepFor(std::chrono::seconds d) = 0;
};

class SystemClock final : public IClock {
  public:
    std::int64_t NowUnix() const override;
    void SleepFor(std::chrono::seconds d) override;
};

} // namespace pagebridge

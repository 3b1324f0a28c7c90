#pragma once

#include "common/types.h"
#include <chrono>

namespace repute {
namespace engine {

using namespace repute::common;

/**
 * Host time source. The engine reads it once per action and trusts the
 * value; it is expected to be non-decreasing.
 */
class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

/// Wall clock in seconds since the Unix epoch
class SystemClock : public IClock {
public:
    Timestamp now() const override {
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch())
                .count());
    }
};

/// Clock driven by the host, used for replay and tests
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp now) { now_ = now; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

} // namespace engine
} // namespace repute

#pragma once

#include <cstdint>
#include <atomic>

namespace coursedao {
namespace core {

class Clock {
public:
    virtual ~Clock() = default;
    // Seconds. Never decreases between calls.
    virtual uint64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t now() const override;

private:
    mutable std::atomic<uint64_t> last_{0};
};

class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start = 0) : now_(start) {}

    uint64_t now() const override { return now_; }
    // Returns false, leaving the time unchanged, if ts is in the past.
    bool set(uint64_t ts);
    void advance(uint64_t seconds) { now_ += seconds; }

private:
    std::atomic<uint64_t> now_;
};

}
}

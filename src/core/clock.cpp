#include "core/clock.h"
#include <chrono>

namespace coursedao {
namespace core {

uint64_t SystemClock::now() const {
    uint64_t wall = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    uint64_t prev = last_.load();
    while (wall > prev && !last_.compare_exchange_weak(prev, wall)) {}
    return wall > prev ? wall : prev;
}

bool ManualClock::set(uint64_t ts) {
    if (ts < now_) return false;
    now_ = ts;
    return true;
}

}
}

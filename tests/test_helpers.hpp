#pragma once

#include "store/ExpiryPolicy.hpp"
#include "store/SessionStore.h"

#include <atomic>
#include <chrono>
#include <memory>

namespace cloudclip::test {

// Wall clock the test moves by hand.
class ManualClock {
public:
    ManualClock()
        : now_(store::Clock::now().time_since_epoch().count()) {}

    store::Clock::time_point now() const {
        return store::Clock::time_point(store::Clock::duration(now_.load()));
    }

    void advance(store::Clock::duration d) { now_ += d.count(); }

    store::SessionStore::NowFn fn() {
        return [this] { return now(); };
    }

private:
    std::atomic<store::Clock::rep> now_;
};

} // namespace cloudclip::test

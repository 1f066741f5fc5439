#pragma once

#include "common/Types.h"

#include <atomic>
#include <chrono>

namespace stratvault {

class IClock {
public:
    virtual ~IClock() = default;
    virtual EpochSeconds now() const = 0;
};

class SystemClock : public IClock {
public:
    EpochSeconds now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// Settable clock for paper runs and tests.
class ManualClock : public IClock {
public:
    explicit ManualClock(EpochSeconds start = 0) : now_(start) {}

    EpochSeconds now() const override { return now_.load(); }
    void set(EpochSeconds t) { now_.store(t); }
    void advance(EpochSeconds delta) { now_.fetch_add(delta); }

private:
    std::atomic<EpochSeconds> now_;
};

} // namespace stratvault

#pragma once
#include <chrono>

#include "core/types.hpp"

class IClock {
public:
    virtual ~IClock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock final : public IClock {
public:
    Timestamp now() const override {
        using namespace std::chrono;
        return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
    }
};

// Clock driven by hand; used by tests and replay tooling.
class ManualClock final : public IClock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_; }
    void set(Timestamp t) { now_ = t; }
    void advance(Timestamp seconds) { now_ += seconds; }

private:
    Timestamp now_;
};

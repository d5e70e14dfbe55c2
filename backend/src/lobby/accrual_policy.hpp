#pragma once
#include <limits>

#include "lobby/lobby.hpp"

// Brings a BreweryStatus forward to a point in time. Implementations must leave
// last_updated_at == now. Points and end-of-game settlement are not part of
// this interface.
class IAccrualPolicy {
public:
    virtual ~IAccrualPolicy() = default;
    virtual void checkpoint(BreweryStatus& status, Timestamp now) const = 0;
};

// Mead accrues at mead_per_second for every second the valve was open since
// the last checkpoint. Saturates instead of wrapping.
class OpenValveAccrual final : public IAccrualPolicy {
public:
    void checkpoint(BreweryStatus& status, Timestamp now) const override {
        if (status.is_valve_opened && now > status.last_updated_at) {
            const Amount elapsed = static_cast<Amount>(now - status.last_updated_at);
            constexpr Amount kMax = std::numeric_limits<Amount>::max();
            Amount produced = kMax;
            if (status.mead_per_second == 0 || elapsed <= kMax / status.mead_per_second) {
                produced = elapsed * status.mead_per_second;
            }
            status.mead = (kMax - status.mead < produced) ? kMax : status.mead + produced;
        }
        status.last_updated_at = now;
    }
};

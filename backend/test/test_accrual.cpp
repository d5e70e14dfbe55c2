#include "lobby/accrual_policy.hpp"

#include <cassert>
#include <iostream>
#include <limits>

int main() {
    OpenValveAccrual policy;

    BreweryStatus s;
    s.mead_per_second = 4;
    s.last_updated_at = 100;

    // Closed valve: only the checkpoint moves
    policy.checkpoint(s, 130);
    assert(s.mead == 0 && s.last_updated_at == 130);

    s.is_valve_opened = true;
    policy.checkpoint(s, 140);
    assert(s.mead == 40 && s.last_updated_at == 140);

    // Same instant twice adds nothing
    policy.checkpoint(s, 140);
    assert(s.mead == 40);

    // A clock that went backwards never produces
    policy.checkpoint(s, 120);
    assert(s.mead == 40 && s.last_updated_at == 120);

    // Points are left to a settlement policy
    assert(s.points == 0);

    // Saturates instead of wrapping
    const Amount max = std::numeric_limits<Amount>::max();
    BreweryStatus big;
    big.is_valve_opened = true;
    big.mead_per_second = max / 2;
    big.last_updated_at = 0;
    policy.checkpoint(big, 10);
    assert(big.mead == max);
    policy.checkpoint(big, 20);
    assert(big.mead == max);

    std::cout << "accrual OK\n";
    return 0;
}

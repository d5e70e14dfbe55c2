#include "market/fee_split.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

static void check_sum(Amount price, std::uint32_t fee, std::uint32_t treasury) {
    const FeeSplit s = compute_fee_split(price, fee, treasury);
    assert(s.seller_amount + s.treasury_amount + s.reward_pool_amount == price);
    assert(s.tax == s.treasury_amount + s.reward_pool_amount);
    assert(s.tax <= price);
}

int main() {
    // 5% fee, 30% of it to treasury
    FeeSplit s = compute_fee_split(1000, 500, 3000);
    assert(s.tax == 50);
    assert(s.treasury_amount == 15);
    assert(s.reward_pool_amount == 35);
    assert(s.seller_amount == 950);

    // Truncation: 999 * 5% = 49.95 -> 49; 49 * 30% = 14.7 -> 14
    s = compute_fee_split(999, 500, 3000);
    assert(s.tax == 49);
    assert(s.treasury_amount == 14);
    assert(s.reward_pool_amount == 35);
    assert(s.seller_amount == 950);

    // Tiny prices round the fee away entirely
    s = compute_fee_split(19, 500, 3000);
    assert(s.tax == 0 && s.seller_amount == 19);

    // Edge rates
    s = compute_fee_split(12345, 0, 3000);
    assert(s.tax == 0 && s.seller_amount == 12345);
    s = compute_fee_split(12345, 10000, 10000);
    assert(s.tax == 12345 && s.treasury_amount == 12345 && s.seller_amount == 0);
    s = compute_fee_split(12345, 10000, 0);
    assert(s.reward_pool_amount == 12345 && s.treasury_amount == 0);

    // No overflow at the top of the range
    const Amount max = std::numeric_limits<Amount>::max();
    assert(apply_basis_points(max, 10000) == max);
    assert(apply_basis_points(max, 5000) == max / 2);
    s = compute_fee_split(max, 250, 7000);
    assert(s.tax == max / 10000 * 250 + (max % 10000) * 250 / 10000);

    for (Amount price : {Amount{0}, Amount{1}, Amount{9999}, Amount{10000}, Amount{10001},
                         Amount{123456789}, max - 1, max}) {
        for (std::uint32_t fee : {0u, 1u, 250u, 500u, 9999u, 10000u}) {
            for (std::uint32_t treasury : {0u, 1u, 3000u, 10000u}) {
                check_sum(price, fee, treasury);
            }
        }
    }

    std::cout << "fee split OK\n";
    return 0;
}

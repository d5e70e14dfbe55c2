#pragma once
#include <cstdint>

#include "core/types.hpp"

struct FeeSplit {
    Amount tax{0};
    Amount treasury_amount{0};
    Amount reward_pool_amount{0};
    Amount seller_amount{0};
};

// floor(amount * rate_bps / 10000) for rate_bps <= 10000. Splitting amount into
// q * 10000 + r keeps every intermediate within 64 bits.
inline Amount apply_basis_points(Amount amount, std::uint32_t rate_bps) {
    const Amount q = amount / kBasisPointsDenominator;
    const Amount r = amount % kBasisPointsDenominator;
    return q * rate_bps + (r * rate_bps) / kBasisPointsDenominator;
}

// seller_amount + treasury_amount + reward_pool_amount == price, always.
inline FeeSplit compute_fee_split(Amount price, std::uint32_t fee_rate, std::uint32_t treasury_fee_rate) {
    FeeSplit s;
    s.tax = apply_basis_points(price, fee_rate);
    s.treasury_amount = apply_basis_points(s.tax, treasury_fee_rate);
    s.reward_pool_amount = s.tax - s.treasury_amount;
    s.seller_amount = price - s.tax;
    return s;
}

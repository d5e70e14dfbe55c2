#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/types.hpp"

class ISettingsProvider {
public:
    virtual ~ISettingsProvider() = default;
    virtual std::uint32_t fee_rate() const = 0;          // basis points
    virtual std::uint32_t treasury_fee_rate() const = 0; // basis points of the fee
    virtual Address treasury_address() const = 0;
    virtual Address reward_pool_address() const = 0;
};

class StaticSettings final : public ISettingsProvider {
public:
    struct Values {
        std::uint32_t fee_rate{500};
        std::uint32_t treasury_fee_rate{3000};
        Address treasury_address;
        Address reward_pool_address;
    };

    explicit StaticSettings(Values v) : v_(std::move(v)) {
        if (v_.fee_rate > kBasisPointsDenominator) {
            throw std::invalid_argument("fee rate above 10000 basis points");
        }
        if (v_.treasury_fee_rate > kBasisPointsDenominator) {
            throw std::invalid_argument("treasury fee rate above 10000 basis points");
        }
        if (v_.treasury_address.empty() || v_.reward_pool_address.empty()) {
            throw std::invalid_argument("treasury and reward pool addresses are required");
        }
    }

    std::uint32_t fee_rate() const override { return v_.fee_rate; }
    std::uint32_t treasury_fee_rate() const override { return v_.treasury_fee_rate; }
    Address treasury_address() const override { return v_.treasury_address; }
    Address reward_pool_address() const override { return v_.reward_pool_address; }

private:
    Values v_;
};

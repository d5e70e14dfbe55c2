#pragma once
#include <optional>

#include "core/types.hpp"

enum class OrderStatus { ACTIVE, CANCELED, SOLD };

inline const char* to_cstr(OrderStatus st) {
    switch (st) {
        case OrderStatus::ACTIVE:   return "ACTIVE";
        case OrderStatus::CANCELED: return "CANCELED";
        case OrderStatus::SOLD:     return "SOLD";
    }
    return "?";
}

struct Order {
    OrderId id{0};               // assigned by the store, sequential from 0
    OrderStatus status{OrderStatus::ACTIVE};
    AssetId asset_id{0};
    Address seller;
    std::optional<Address> buyer; // set iff status == SOLD
    Amount price{0};
};

#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "core/context.hpp"
#include "core/error.hpp"
#include "core/pagination.hpp"
#include "market/fee_split.hpp"
#include "market/order.hpp"
#include "market/order_store.hpp"

struct MarketOptions {
    // Account that holds listed assets and in-flight payments.
    Address custody_address{"escrow:market"};
};

struct SaleReceipt {
    Order order;
    FeeSplit split;
};

// Escrow market for unique assets priced in the value ledger's unit.
//
// Orders move Active -> Canceled or Active -> Sold and never leave a terminal
// status. Each write checks its preconditions against the current order, then
// commits the new order state, then moves value and assets, inside a single
// OperationScope: if any movement fails the order state is restored too.
class OrderMarket {
public:
    OrderMarket(EscrowContext ctx, MarketOptions opts);

    // Lists `asset_id` at `price`. The caller must own the asset and have
    // approved the custody account as operator.
    Outcome<Order> create_order(const Address& caller, AssetId asset_id, Amount price);

    Outcome<Order> update_order(const Address& caller, OrderId order_id, Amount price);

    Outcome<Order> cancel_order(const Address& caller, OrderId order_id);

    // `amount` must equal the current price; a price changed since the caller
    // last looked is a hard failure, never a partial fill.
    Outcome<SaleReceipt> buy_order(const Address& caller, OrderId order_id, Amount amount);

    std::optional<Order> get_order(OrderId order_id) const;
    std::size_t order_count() const { return store_.size(); }

    std::size_t count_owned_orders(const Address& seller) const { return store_.owned(seller).size(); }
    std::size_t count_bought_orders(const Address& buyer) const { return store_.bought(buyer).size(); }
    Page<OrderId> owned_orders_page(const Address& seller, std::size_t cursor, std::size_t how_many) const;
    Page<OrderId> bought_orders_page(const Address& buyer, std::size_t cursor, std::size_t how_many) const;

    const Address& custody_address() const { return opts_.custody_address; }

private:
    // Resolves an order the seller may still act on.
    Outcome<Order*> seller_active_order(const Address& caller, OrderId order_id);
    void pay_out(const Address& to, Amount amount);

    EscrowContext ctx_;
    MarketOptions opts_;
    OrderStore store_;
};

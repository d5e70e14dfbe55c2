#include "market/order_market.hpp"

#include "core/operation.hpp"

#include <string>
#include <utility>

namespace
{
    std::string order_ref(OrderId id) { return "order " + std::to_string(id); }

    EscrowError not_found(OrderId id)
    {
        return EscrowError{EscrowErrorCode::NotFound, order_ref(id) + " does not exist"};
    }

    EscrowError not_active(const Order& o)
    {
        return EscrowError{EscrowErrorCode::InvalidState,
                           order_ref(o.id) + " is " + to_cstr(o.status) + ", not ACTIVE"};
    }

    EscrowError empty_caller()
    {
        return EscrowError{EscrowErrorCode::InvalidArgument, "caller address is empty"};
    }

    // The custody account only ever acts through the market itself.
    EscrowError custody_caller()
    {
        return EscrowError{EscrowErrorCode::Unauthorized, "custody account cannot trade on the market"};
    }
}

OrderMarket::OrderMarket(EscrowContext ctx, MarketOptions opts)
    : ctx_(ctx), opts_(std::move(opts))
{
}

Outcome<Order> OrderMarket::create_order(const Address& caller, AssetId asset_id, Amount price)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();

    auto owner = ctx_.assets.owner_of(asset_id);
    if (!owner) {
        return EscrowError{EscrowErrorCode::NotFound,
                           "asset " + std::to_string(asset_id) + " does not exist"};
    }
    if (*owner != caller) {
        return EscrowError{EscrowErrorCode::Unauthorized,
                           "caller does not own asset " + std::to_string(asset_id)};
    }

    return run_in_scope<Order>({&ctx_.assets}, [&](OperationScope& scope) {
        Order o;
        o.status = OrderStatus::ACTIVE;
        o.asset_id = asset_id;
        o.seller = caller;
        o.price = price;

        const OrderId id = store_.append(std::move(o));
        store_.index_owned(caller, id);
        scope.on_rollback([this, caller] {
            store_.unindex_owned(caller);
            store_.drop_last();
        });

        ctx_.assets.transfer_custody(opts_.custody_address, caller, opts_.custody_address, asset_id);

        ctx_.events.publish(OrderCreated{id, asset_id, caller, price});
        return *store_.find(id);
    });
}

Outcome<Order> OrderMarket::update_order(const Address& caller, OrderId order_id, Amount price)
{
    auto found = seller_active_order(caller, order_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Order* order = std::get<Order*>(found);

    return run_in_scope<Order>({}, [&](OperationScope& scope) {
        const Amount before = order->price;
        order->price = price;
        scope.on_rollback([order, before] { order->price = before; });

        ctx_.events.publish(OrderUpdated{order->id, order->seller, price});
        return *order;
    });
}

Outcome<Order> OrderMarket::cancel_order(const Address& caller, OrderId order_id)
{
    auto found = seller_active_order(caller, order_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Order* order = std::get<Order*>(found);

    return run_in_scope<Order>({&ctx_.assets}, [&](OperationScope& scope) {
        // Terminal status first; the asset only leaves custody afterwards.
        order->status = OrderStatus::CANCELED;
        scope.on_rollback([order] { order->status = OrderStatus::ACTIVE; });

        ctx_.assets.transfer_custody(opts_.custody_address, opts_.custody_address,
                                     order->seller, order->asset_id);

        ctx_.events.publish(OrderCanceled{order->id, order->asset_id, order->seller});
        return *order;
    });
}

Outcome<SaleReceipt> OrderMarket::buy_order(const Address& caller, OrderId order_id, Amount amount)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();

    Order* order = store_.find(order_id);
    if (!order) return not_found(order_id);
    if (order->status != OrderStatus::ACTIVE) return not_active(*order);
    if (amount != order->price) {
        return EscrowError{EscrowErrorCode::AmountMismatch,
                           order_ref(order_id) + " is priced " + std::to_string(order->price) +
                           ", offered " + std::to_string(amount)};
    }

    const std::uint32_t fee_rate = ctx_.settings.fee_rate();
    const std::uint32_t treasury_fee_rate = ctx_.settings.treasury_fee_rate();
    if (fee_rate > kBasisPointsDenominator || treasury_fee_rate > kBasisPointsDenominator) {
        return EscrowError{EscrowErrorCode::InvalidArgument, "fee settings exceed 10000 basis points"};
    }
    const Address treasury = ctx_.settings.treasury_address();
    const Address reward_pool = ctx_.settings.reward_pool_address();
    const FeeSplit split = compute_fee_split(order->price, fee_rate, treasury_fee_rate);

    return run_in_scope<SaleReceipt>({&ctx_.value, &ctx_.assets}, [&](OperationScope& scope) {
        // Effects before interactions: the order is Sold before any value or
        // asset moves, so nothing observed during the transfers sees it Active.
        order->buyer = caller;
        order->status = OrderStatus::SOLD;
        store_.index_bought(caller, order_id);
        scope.on_rollback([this, order, caller] {
            store_.unindex_bought(caller);
            order->status = OrderStatus::ACTIVE;
            order->buyer.reset();
        });

        const Address& custody = opts_.custody_address;
        ctx_.value.transfer_from(custody, caller, custody, amount);

        pay_out(treasury, split.treasury_amount);
        pay_out(reward_pool, split.reward_pool_amount);
        pay_out(order->seller, split.seller_amount);

        ctx_.assets.transfer_custody(custody, custody, caller, order->asset_id);

        ctx_.events.publish(OrderBought{
            order->id, order->asset_id, order->seller, caller, order->price,
            split.seller_amount, split.treasury_amount, split.reward_pool_amount,
        });
        return SaleReceipt{*order, split};
    });
}

std::optional<Order> OrderMarket::get_order(OrderId order_id) const
{
    const Order* o = store_.find(order_id);
    if (!o) return std::nullopt;
    return *o;
}

Page<OrderId> OrderMarket::owned_orders_page(const Address& seller, std::size_t cursor,
                                             std::size_t how_many) const
{
    return fetch_page(store_.owned(seller), cursor, how_many);
}

Page<OrderId> OrderMarket::bought_orders_page(const Address& buyer, std::size_t cursor,
                                              std::size_t how_many) const
{
    return fetch_page(store_.bought(buyer), cursor, how_many);
}

Outcome<Order*> OrderMarket::seller_active_order(const Address& caller, OrderId order_id)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();

    Order* order = store_.find(order_id);
    if (!order) return not_found(order_id);
    if (order->status != OrderStatus::ACTIVE) return not_active(*order);
    if (order->seller != caller) {
        return EscrowError{EscrowErrorCode::Unauthorized, "caller is not the seller of " + order_ref(order_id)};
    }
    return order;
}

void OrderMarket::pay_out(const Address& to, Amount amount)
{
    // The sale's own escrowed payment covers every payout; zero shares are skipped.
    if (amount == 0) return;
    ctx_.value.transfer(opts_.custody_address, to, amount);
}

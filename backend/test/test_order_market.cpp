#include "market/order_market.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <variant>

static void print(const Order& o) {
    std::cout << "order " << o.id << " | asset=" << o.asset_id << " | seller=" << o.seller
              << " | buyer=" << (o.buyer ? *o.buyer : "-") << " | px=" << o.price
              << " | status=" << to_cstr(o.status) << "\n";
}

// Seller "alice" owns assets 1..3 and has approved the market; buyer "bob" holds 10000.
struct MarketFixture {
    Harness h;
    OrderMarket market{h.ctx(), MarketOptions{}};

    MarketFixture() {
        for (AssetId a = 1; a <= 3; ++a) h.assets.mint("alice", a);
        h.assets.set_approval_for_all("alice", market.custody_address(), true);
        h.ledger.mint("bob", 10000);
        h.ledger.approve("bob", market.custody_address(), 10000);
    }
};

static void create_and_buy() {
    MarketFixture f;
    auto created = f.market.create_order("alice", 1, 1000);
    assert(ok(created));
    const Order order = value(created);
    print(order);
    assert(order.id == 0);
    assert(order.status == OrderStatus::ACTIVE);
    assert(!order.buyer);
    assert(f.h.assets.owner_of(1) == f.market.custody_address());
    assert(f.market.count_owned_orders("alice") == 1);

    auto sold = f.market.buy_order("bob", order.id, 1000);
    assert(ok(sold));
    const SaleReceipt& r = value(sold);
    print(r.order);
    assert(r.order.status == OrderStatus::SOLD);
    assert(r.order.buyer && *r.order.buyer == "bob");
    assert(r.split.tax == 50);
    assert(r.split.treasury_amount == 15);
    assert(r.split.reward_pool_amount == 35);
    assert(r.split.seller_amount == 950);

    assert(f.h.ledger.balance_of("alice") == 950);
    assert(f.h.ledger.balance_of("treasury") == 15);
    assert(f.h.ledger.balance_of("reward-pool") == 35);
    assert(f.h.ledger.balance_of("bob") == 9000);
    assert(f.h.ledger.balance_of(f.market.custody_address()) == 0);
    assert(f.h.assets.owner_of(1) == Address("bob"));
    assert(f.market.count_bought_orders("bob") == 1);

    // Sold is terminal
    assert(code(f.market.buy_order("bob", order.id, 1000)) == EscrowErrorCode::InvalidState);
    assert(code(f.market.update_order("alice", order.id, 5)) == EscrowErrorCode::InvalidState);
    assert(code(f.market.cancel_order("alice", order.id)) == EscrowErrorCode::InvalidState);

    assert(f.h.events.size() == 2);
    assert(std::holds_alternative<OrderCreated>(f.h.events.events()[0]));
    const auto& bought = std::get<OrderBought>(f.h.events.events()[1]);
    assert(bought.buyer == "bob" && bought.seller == "alice" && bought.treasury_amount == 15);
}

static void create_and_cancel() {
    MarketFixture f;
    const Order order = value(f.market.create_order("alice", 2, 300));

    assert(code(f.market.cancel_order("bob", order.id)) == EscrowErrorCode::Unauthorized);
    auto canceled = f.market.cancel_order("alice", order.id);
    assert(ok(canceled));
    assert(value(canceled).status == OrderStatus::CANCELED);
    assert(f.h.assets.owner_of(2) == Address("alice"));

    assert(code(f.market.cancel_order("alice", order.id)) == EscrowErrorCode::InvalidState);
    assert(code(f.market.update_order("alice", order.id, 1)) == EscrowErrorCode::InvalidState);
    assert(code(f.market.buy_order("bob", order.id, 300)) == EscrowErrorCode::InvalidState);
    assert(f.h.ledger.balance_of("bob") == 10000);
    assert(std::holds_alternative<OrderCanceled>(f.h.events.events().back()));
}

static void update_and_mismatch() {
    MarketFixture f;
    const Order order = value(f.market.create_order("alice", 3, 500));

    assert(code(f.market.update_order("bob", order.id, 400)) == EscrowErrorCode::Unauthorized);
    auto updated = f.market.update_order("alice", order.id, 700);
    assert(ok(updated) && value(updated).price == 700);

    // Buyer still offering the old price is rejected and nothing moves
    const std::size_t events_before = f.h.events.size();
    auto stale = f.market.buy_order("bob", order.id, 500);
    assert(code(stale) == EscrowErrorCode::AmountMismatch);
    assert(f.market.get_order(order.id)->status == OrderStatus::ACTIVE);
    assert(!f.market.get_order(order.id)->buyer);
    assert(f.h.ledger.balance_of("bob") == 10000);
    assert(f.h.assets.owner_of(3) == f.market.custody_address());
    assert(f.market.count_bought_orders("bob") == 0);
    assert(f.h.events.size() == events_before);

    assert(ok(f.market.buy_order("bob", order.id, 700)));
}

static void create_preconditions() {
    MarketFixture f;
    assert(code(f.market.create_order("bob", 1, 10)) == EscrowErrorCode::Unauthorized);
    assert(code(f.market.create_order("alice", 99, 10)) == EscrowErrorCode::NotFound);
    assert(code(f.market.create_order("", 1, 10)) == EscrowErrorCode::InvalidArgument);
    assert(code(f.market.update_order("alice", 42, 10)) == EscrowErrorCode::NotFound);
    assert(code(f.market.buy_order("bob", 42, 10)) == EscrowErrorCode::NotFound);
    assert(f.market.order_count() == 0);

    // Owner that never approved the market: the custody move fails and the order is not kept
    f.h.assets.mint("carol", 7);
    auto out = f.market.create_order("carol", 7, 10);
    assert(code(out) == EscrowErrorCode::TransferFailed);
    assert(f.market.order_count() == 0);
    assert(f.market.count_owned_orders("carol") == 0);
    assert(f.h.assets.owner_of(7) == Address("carol"));

    // Ids restart where the failed create left off
    assert(value(f.market.create_order("alice", 1, 10)).id == 0);
}

static void failed_payment_rolls_back() {
    MarketFixture f;
    const Order order = value(f.market.create_order("alice", 1, 1000));

    // dave has funds but no allowance for the market
    f.h.ledger.mint("dave", 5000);
    auto out = f.market.buy_order("dave", order.id, 1000);
    assert(code(out) == EscrowErrorCode::TransferFailed);

    const Order after = *f.market.get_order(order.id);
    assert(after.status == OrderStatus::ACTIVE);
    assert(!after.buyer);
    assert(f.market.count_bought_orders("dave") == 0);
    assert(f.h.ledger.balance_of("dave") == 5000);
    assert(f.h.ledger.balance_of("alice") == 0);
    assert(f.h.ledger.balance_of("treasury") == 0);
    assert(f.h.assets.owner_of(1) == f.market.custody_address());

    // The order is still buyable by someone who can pay
    assert(ok(f.market.buy_order("bob", order.id, 1000)));
}

static void sink_failure_rolls_back() {
    Harness h;
    FailingSink sink;
    EscrowContext ctx{h.ledger, h.assets, h.settings, h.clock, sink};
    OrderMarket market{ctx, MarketOptions{}};
    h.assets.mint("alice", 1);
    h.assets.set_approval_for_all("alice", market.custody_address(), true);

    auto out = market.create_order("alice", 1, 100);
    assert(code(out) == EscrowErrorCode::EventSinkFailure);
    assert(market.order_count() == 0);
    assert(h.assets.owner_of(1) == Address("alice"));
}

static void zero_fee_skips_transfers() {
    Harness h;
    StaticSettings free_settings{StaticSettings::Values{0, 0, "treasury", "reward-pool"}};
    EscrowContext ctx{h.ledger, h.assets, free_settings, h.clock, h.events};
    OrderMarket market{ctx, MarketOptions{"custody"}};
    h.assets.mint("alice", 1);
    h.assets.set_approval_for_all("alice", "custody", true);
    h.ledger.mint("bob", 100);
    h.ledger.approve("bob", "custody", 100);

    const Order order = value(market.create_order("alice", 1, 100));
    auto sold = market.buy_order("bob", order.id, 100);
    assert(ok(sold));
    assert(value(sold).split.tax == 0);
    assert(h.ledger.balance_of("alice") == 100);
    assert(h.ledger.balance_of("treasury") == 0);
}

static void custody_account_cannot_trade() {
    MarketFixture f;
    const Order listed = value(f.market.create_order("alice", 1, 1000));
    const Address custody = f.market.custody_address();
    f.h.ledger.mint(custody, 1000);
    const std::size_t events_before = f.h.events.size();

    // Custody owns every escrowed asset but may not relist one
    assert(code(f.market.create_order(custody, 1, 10)) == EscrowErrorCode::Unauthorized);
    assert(f.market.order_count() == 1);
    assert(code(f.market.update_order(custody, listed.id, 10)) == EscrowErrorCode::Unauthorized);
    assert(code(f.market.cancel_order(custody, listed.id)) == EscrowErrorCode::Unauthorized);
    assert(code(f.market.buy_order(custody, listed.id, 1000)) == EscrowErrorCode::Unauthorized);
    assert(f.h.events.size() == events_before);

    // The original listing is untouched and still cancelable
    assert(f.market.get_order(listed.id)->status == OrderStatus::ACTIVE);
    assert(f.h.assets.owner_of(1) == custody);
    assert(ok(f.market.cancel_order("alice", listed.id)));
    assert(f.h.assets.owner_of(1) == Address("alice"));
}

int main() {
    create_and_buy();
    create_and_cancel();
    update_and_mismatch();
    create_preconditions();
    failed_payment_rolls_back();
    sink_failure_rolls_back();
    zero_fee_skips_transfers();
    custody_account_cannot_trade();

    std::cout << "\norder market OK\n";
    return 0;
}

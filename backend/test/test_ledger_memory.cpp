#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"

#include <cassert>
#include <iostream>

template <typename Fn>
static bool throws_ledger_error(Fn fn) {
    try {
        fn();
    } catch (const LedgerError& e) {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

static void value_ledger() {
    MemoryValueLedger ledger;
    ledger.mint("alice", 100);
    assert(ledger.balance_of("alice") == 100);
    assert(ledger.total_supply() == 100);

    ledger.transfer("alice", "bob", 40);
    assert(ledger.balance_of("alice") == 60 && ledger.balance_of("bob") == 40);
    assert(throws_ledger_error([&] { ledger.transfer("alice", "bob", 61); }));
    assert(throws_ledger_error([&] { ledger.transfer("alice", "", 1); }));

    // Spending needs an allowance, which is consumed
    assert(throws_ledger_error([&] { ledger.transfer_from("escrow", "alice", "escrow", 10); }));
    ledger.approve("alice", "escrow", 50);
    ledger.transfer_from("escrow", "alice", "escrow", 30);
    assert(ledger.allowance("alice", "escrow") == 20);
    assert(ledger.balance_of("escrow") == 30);

    // Allowance without balance leaves the allowance untouched
    ledger.approve("bob", "escrow", 1000);
    assert(throws_ledger_error([&] { ledger.transfer_from("escrow", "bob", "escrow", 41); }));
    assert(ledger.allowance("bob", "escrow") == 1000);
}

static void value_ledger_rollback() {
    MemoryValueLedger ledger;
    ledger.mint("alice", 100);
    ledger.approve("alice", "escrow", 100);

    ledger.begin();
    ledger.transfer_from("escrow", "alice", "escrow", 70);
    ledger.transfer("escrow", "carol", 20);
    ledger.mint("dave", 5);
    assert(ledger.balance_of("carol") == 20);
    ledger.rollback();

    assert(ledger.balance_of("alice") == 100);
    assert(ledger.balance_of("escrow") == 0);
    assert(ledger.balance_of("carol") == 0);
    assert(ledger.balance_of("dave") == 0);
    assert(ledger.allowance("alice", "escrow") == 100);
    assert(ledger.total_supply() == 100);

    ledger.begin();
    ledger.transfer("alice", "bob", 10);
    ledger.commit();
    assert(ledger.balance_of("bob") == 10);

    // A rollback after commit has nothing to undo
    ledger.rollback();
    assert(ledger.balance_of("bob") == 10);

    ledger.begin();
    assert(throws_ledger_error([&] { ledger.begin(); }));
    ledger.commit();
}

static void asset_registry() {
    MemoryAssetRegistry reg;
    reg.mint("alice", 7);
    assert(reg.owner_of(7) == Address("alice"));
    assert(!reg.owner_of(8));
    assert(throws_ledger_error([&] { reg.mint("bob", 7); }));

    // Operator must be approved
    assert(throws_ledger_error([&] { reg.transfer_custody("market", "alice", "market", 7); }));
    reg.set_approval_for_all("alice", "market", true);
    reg.transfer_custody("market", "alice", "market", 7);
    assert(reg.owner_of(7) == Address("market"));

    // Wrong current owner
    assert(throws_ledger_error([&] { reg.transfer_custody("alice", "alice", "bob", 7); }));
    assert(throws_ledger_error([&] { reg.transfer_custody("x", "x", "y", 99); }));

    reg.begin();
    reg.transfer_custody("market", "market", "bob", 7);
    reg.set_approval_for_all("alice", "market", false);
    reg.mint("carol", 8);
    reg.rollback();
    assert(reg.owner_of(7) == Address("market"));
    assert(reg.is_approved_for_all("alice", "market"));
    assert(!reg.owner_of(8));
}

int main() {
    value_ledger();
    value_ledger_rollback();
    asset_registry();

    std::cout << "memory ledgers OK\n";
    return 0;
}

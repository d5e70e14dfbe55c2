#include "core/operation.hpp"
#include "core/transaction.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Records the calls it receives.
struct Probe final : public ITransactional {
    std::vector<std::string>& log;
    std::string name;
    bool fail_begin{false};

    Probe(std::vector<std::string>& l, std::string n) : log(l), name(std::move(n)) {}

    void begin() override {
        if (fail_begin) throw LedgerError(name + " unavailable");
        log.push_back(name + ".begin");
    }
    void commit() override { log.push_back(name + ".commit"); }
    void rollback() override { log.push_back(name + ".rollback"); }
};

int main() {
    std::vector<std::string> log;
    Probe a{log, "a"};
    Probe b{log, "b"};

    {
        OperationScope scope{&a, &b};
        scope.on_rollback([&] { log.push_back("undo1"); });
        scope.commit();
    }
    assert((log == std::vector<std::string>{"a.begin", "b.begin", "a.commit", "b.commit"}));

    // Leaving without commit: local undo newest-first, then participants in reverse
    log.clear();
    {
        OperationScope scope{&a, &b};
        scope.on_rollback([&] { log.push_back("undo1"); });
        scope.on_rollback([&] { log.push_back("undo2"); });
    }
    assert((log == std::vector<std::string>{"a.begin", "b.begin", "undo2", "undo1", "b.rollback", "a.rollback"}));

    // run_in_scope maps ledger failures and undoes local state
    log.clear();
    int counter = 0;
    auto failed = run_in_scope<int>({&a}, [&](OperationScope& scope) {
        ++counter;
        scope.on_rollback([&] { --counter; });
        throw LedgerError("insufficient balance");
        return counter;
    });
    assert(std::get<EscrowError>(failed).code == EscrowErrorCode::TransferFailed);
    assert(std::get<EscrowError>(failed).message == "insufficient balance");
    assert(counter == 0);
    assert((log == std::vector<std::string>{"a.begin", "a.rollback"}));

    auto sink = run_in_scope<int>({}, [&](OperationScope&) -> int { throw EventSinkError("down"); });
    assert(std::get<EscrowError>(sink).code == EscrowErrorCode::EventSinkFailure);

    auto fine = run_in_scope<int>({&a}, [&](OperationScope&) { return 42; });
    assert(std::get<int>(fine) == 42);

    // A participant that cannot begin releases the ones already opened
    log.clear();
    b.fail_begin = true;
    auto refused = run_in_scope<int>({&a, &b}, [&](OperationScope&) { return 1; });
    assert(std::get<EscrowError>(refused).code == EscrowErrorCode::TransferFailed);
    assert((log == std::vector<std::string>{"a.begin", "a.rollback"}));

    std::cout << "operation scope OK\n";
    return 0;
}

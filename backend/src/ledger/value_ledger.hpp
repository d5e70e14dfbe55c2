#pragma once
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/transaction.hpp"
#include "core/types.hpp"

// Fungible balances. Movements that cannot be honored throw LedgerError.
class IValueLedger : public ITransactional {
public:
    virtual Amount balance_of(const Address& account) const = 0;
    virtual Amount allowance(const Address& owner, const Address& spender) const = 0;

    // Moves `amount` out of `from`'s own balance.
    virtual void transfer(const Address& from, const Address& to, Amount amount) = 0;

    // Moves `amount` from `from` to `to`, spending `spender`'s allowance on `from`.
    virtual void transfer_from(const Address& spender, const Address& from,
                               const Address& to, Amount amount) = 0;
};

// Reference ledger kept in process memory. Writes made inside begin()/commit()
// are journaled so rollback() restores the previous balances and allowances.
class MemoryValueLedger final : public IValueLedger {
public:
    Amount balance_of(const Address& account) const override;
    Amount allowance(const Address& owner, const Address& spender) const override;
    void transfer(const Address& from, const Address& to, Amount amount) override;
    void transfer_from(const Address& spender, const Address& from,
                       const Address& to, Amount amount) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    void mint(const Address& to, Amount amount);
    void approve(const Address& owner, const Address& spender, Amount amount);
    Amount total_supply() const { return total_supply_; }

private:
    void move(const Address& from, const Address& to, Amount amount);
    void set_balance(const Address& account, Amount value);
    void set_allowance(const Address& owner, const Address& spender, Amount value);

    std::unordered_map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount total_supply_{0};

    bool in_tx_{false};
    std::vector<std::function<void()>> journal_;
};

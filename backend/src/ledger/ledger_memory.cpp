#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"

#include <limits>
#include <string>

namespace
{
    std::string describe(const Address& a) { return a.empty() ? std::string("<empty>") : a; }
}

// ---------------------------------------------------------------------------
// MemoryValueLedger
// ---------------------------------------------------------------------------

Amount MemoryValueLedger::balance_of(const Address& account) const
{
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

Amount MemoryValueLedger::allowance(const Address& owner, const Address& spender) const
{
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

void MemoryValueLedger::transfer(const Address& from, const Address& to, Amount amount)
{
    move(from, to, amount);
}

void MemoryValueLedger::transfer_from(const Address& spender, const Address& from,
                                      const Address& to, Amount amount)
{
    if (spender != from) {
        const Amount allowed = allowance(from, spender);
        if (allowed < amount) {
            throw LedgerError("insufficient allowance: " + describe(spender) + " may spend " +
                              std::to_string(allowed) + " of " + describe(from) +
                              ", needs " + std::to_string(amount));
        }
        // Balance is checked before the allowance is consumed so a failed move leaves it intact.
        if (balance_of(from) < amount) {
            throw LedgerError("insufficient balance: " + describe(from) + " holds " +
                              std::to_string(balance_of(from)) + ", needs " + std::to_string(amount));
        }
        set_allowance(from, spender, allowed - amount);
    }
    move(from, to, amount);
}

void MemoryValueLedger::mint(const Address& to, Amount amount)
{
    if (to.empty()) throw LedgerError("mint to the empty address");
    if (std::numeric_limits<Amount>::max() - total_supply_ < amount) {
        throw LedgerError("mint overflows total supply");
    }
    const Amount before = total_supply_;
    total_supply_ += amount;
    if (in_tx_) journal_.push_back([this, before] { total_supply_ = before; });
    set_balance(to, balance_of(to) + amount);
}

void MemoryValueLedger::approve(const Address& owner, const Address& spender, Amount amount)
{
    if (owner.empty() || spender.empty()) throw LedgerError("approve with the empty address");
    set_allowance(owner, spender, amount);
}

void MemoryValueLedger::begin()
{
    if (in_tx_) throw LedgerError("value ledger transaction already open");
    in_tx_ = true;
    journal_.clear();
}

void MemoryValueLedger::commit()
{
    in_tx_ = false;
    journal_.clear();
}

void MemoryValueLedger::rollback()
{
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        (*it)();
    }
    journal_.clear();
    in_tx_ = false;
}

void MemoryValueLedger::move(const Address& from, const Address& to, Amount amount)
{
    if (to.empty()) throw LedgerError("transfer to the empty address");
    const Amount have = balance_of(from);
    if (have < amount) {
        throw LedgerError("insufficient balance: " + describe(from) + " holds " +
                          std::to_string(have) + ", needs " + std::to_string(amount));
    }
    if (from == to) return;
    // Cannot overflow: total supply bounds every balance.
    set_balance(from, have - amount);
    set_balance(to, balance_of(to) + amount);
}

void MemoryValueLedger::set_balance(const Address& account, Amount value)
{
    if (in_tx_) {
        auto it = balances_.find(account);
        if (it == balances_.end()) {
            journal_.push_back([this, account] { balances_.erase(account); });
        } else {
            journal_.push_back([this, account, prev = it->second] { balances_[account] = prev; });
        }
    }
    balances_[account] = value;
}

void MemoryValueLedger::set_allowance(const Address& owner, const Address& spender, Amount value)
{
    const auto key = std::make_pair(owner, spender);
    if (in_tx_) {
        auto it = allowances_.find(key);
        if (it == allowances_.end()) {
            journal_.push_back([this, key] { allowances_.erase(key); });
        } else {
            journal_.push_back([this, key, prev = it->second] { allowances_[key] = prev; });
        }
    }
    allowances_[key] = value;
}

// ---------------------------------------------------------------------------
// MemoryAssetRegistry
// ---------------------------------------------------------------------------

std::optional<Address> MemoryAssetRegistry::owner_of(AssetId asset_id) const
{
    auto it = owners_.find(asset_id);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

void MemoryAssetRegistry::transfer_custody(const Address& op, const Address& from,
                                           const Address& to, AssetId asset_id)
{
    auto owner = owner_of(asset_id);
    if (!owner) {
        throw LedgerError("unknown asset " + std::to_string(asset_id));
    }
    if (*owner != from) {
        throw LedgerError("asset " + std::to_string(asset_id) + " is not owned by " + describe(from));
    }
    if (op != from && !is_approved_for_all(from, op)) {
        throw LedgerError(describe(op) + " is neither owner nor approved for asset " +
                          std::to_string(asset_id));
    }
    if (to.empty()) {
        throw LedgerError("asset transfer to the empty address");
    }
    set_owner(asset_id, to);
}

void MemoryAssetRegistry::mint(const Address& to, AssetId asset_id)
{
    if (to.empty()) throw LedgerError("mint to the empty address");
    if (owners_.count(asset_id)) {
        throw LedgerError("asset " + std::to_string(asset_id) + " already minted");
    }
    set_owner(asset_id, to);
}

void MemoryAssetRegistry::set_approval_for_all(const Address& owner, const Address& op, bool approved)
{
    const auto key = std::make_pair(owner, op);
    const bool was = operators_.count(key) > 0;
    if (was == approved) return;
    if (approved) operators_.insert(key); else operators_.erase(key);
    if (in_tx_) {
        journal_.push_back([this, key, was] {
            if (was) operators_.insert(key); else operators_.erase(key);
        });
    }
}

bool MemoryAssetRegistry::is_approved_for_all(const Address& owner, const Address& op) const
{
    return operators_.count({owner, op}) > 0;
}

void MemoryAssetRegistry::begin()
{
    if (in_tx_) throw LedgerError("asset registry transaction already open");
    in_tx_ = true;
    journal_.clear();
}

void MemoryAssetRegistry::commit()
{
    in_tx_ = false;
    journal_.clear();
}

void MemoryAssetRegistry::rollback()
{
    for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
        (*it)();
    }
    journal_.clear();
    in_tx_ = false;
}

void MemoryAssetRegistry::set_owner(AssetId asset_id, const Address& owner)
{
    if (in_tx_) {
        auto it = owners_.find(asset_id);
        if (it == owners_.end()) {
            journal_.push_back([this, asset_id] { owners_.erase(asset_id); });
        } else {
            journal_.push_back([this, asset_id, prev = it->second] { owners_[asset_id] = prev; });
        }
    }
    owners_[asset_id] = owner;
}

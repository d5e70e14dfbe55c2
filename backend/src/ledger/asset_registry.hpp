#pragma once
#include <functional>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/error.hpp"
#include "core/transaction.hpp"
#include "core/types.hpp"

// Ownership of unique assets. Movements that cannot be honored throw LedgerError.
class IAssetRegistry : public ITransactional {
public:
    virtual std::optional<Address> owner_of(AssetId asset_id) const = 0;

    // Moves `asset_id` from `from` to `to`. `op` must be `from` or an operator
    // `from` has approved.
    virtual void transfer_custody(const Address& op, const Address& from,
                                  const Address& to, AssetId asset_id) = 0;
};

class MemoryAssetRegistry final : public IAssetRegistry {
public:
    std::optional<Address> owner_of(AssetId asset_id) const override;
    void transfer_custody(const Address& op, const Address& from,
                          const Address& to, AssetId asset_id) override;

    void begin() override;
    void commit() override;
    void rollback() override;

    void mint(const Address& to, AssetId asset_id);
    void set_approval_for_all(const Address& owner, const Address& op, bool approved);
    bool is_approved_for_all(const Address& owner, const Address& op) const;

private:
    void set_owner(AssetId asset_id, const Address& owner);

    std::unordered_map<AssetId, Address> owners_;
    std::set<std::pair<Address, Address>> operators_;

    bool in_tx_{false};
    std::vector<std::function<void()>> journal_;
};

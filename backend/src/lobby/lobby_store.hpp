#pragma once
#include <cstddef>
#include <map>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lobby/lobby.hpp"

// Append-only lobby arena (ids from 1), creator index, and the lazily created
// per-(lobby, participant) brewery records.
class LobbyStore {
public:
    LobbyId append(Lobby l) {
        l.id = static_cast<LobbyId>(lobbies_.size()) + 1;
        lobbies_.push_back(std::move(l));
        const Lobby& stored = lobbies_.back();
        by_creator_[stored.creator].push_back(stored.id);
        return stored.id;
    }

    // Undo of the latest append.
    void drop_last() {
        if (lobbies_.empty()) return;
        auto it = by_creator_.find(lobbies_.back().creator);
        if (it != by_creator_.end()) {
            it->second.pop_back();
            if (it->second.empty()) by_creator_.erase(it);
        }
        lobbies_.pop_back();
    }

    Lobby* find(LobbyId id) {
        return (id >= 1 && id <= lobbies_.size()) ? &lobbies_[static_cast<std::size_t>(id - 1)] : nullptr;
    }
    const Lobby* find(LobbyId id) const {
        return (id >= 1 && id <= lobbies_.size()) ? &lobbies_[static_cast<std::size_t>(id - 1)] : nullptr;
    }

    std::size_t size() const { return lobbies_.size(); }

    const std::vector<LobbyId>& created_by(const Address& creator) const {
        static const std::vector<LobbyId> kEmpty;
        auto it = by_creator_.find(creator);
        return it == by_creator_.end() ? kEmpty : it->second;
    }

    BreweryStatus* brewery(LobbyId id, const Address& participant) {
        auto it = breweries_.find({id, participant});
        return it == breweries_.end() ? nullptr : &it->second;
    }
    const BreweryStatus* brewery(LobbyId id, const Address& participant) const {
        auto it = breweries_.find({id, participant});
        return it == breweries_.end() ? nullptr : &it->second;
    }

    BreweryStatus& put_brewery(LobbyId id, const Address& participant, BreweryStatus s) {
        auto& slot = breweries_[{id, participant}];
        slot = s;
        return slot;
    }

    void erase_brewery(LobbyId id, const Address& participant) { breweries_.erase({id, participant}); }

private:
    std::vector<Lobby> lobbies_;
    std::unordered_map<Address, std::vector<LobbyId>> by_creator_;
    std::map<std::pair<LobbyId, Address>, BreweryStatus> breweries_;
};

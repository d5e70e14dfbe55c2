#pragma once
#include <cstddef>
#include <memory>
#include <optional>

#include "core/context.hpp"
#include "core/error.hpp"
#include "core/pagination.hpp"
#include "lobby/accrual_policy.hpp"
#include "lobby/lobby.hpp"
#include "lobby/lobby_store.hpp"

struct LobbyOptions {
    // Account that holds the stakes of open lobbies.
    Address custody_address{"escrow:lobby"};
    // Production rate given to a participant's brewery when it is first created.
    Amount mead_per_second{0};
};

// Paired-stake wager lobbies.
//
// A creator opens a lobby with a stake and a future start time; one joiner may
// match the stake and may back out until kUnjoinGuardSeconds before the start.
// The creator may reschedule or cancel until the start, cancellation refunding
// both stakes. From the start time, for kInProgressSeconds, both participants
// may toggle their brewery valve.
class LobbyEngine {
public:
    LobbyEngine(EscrowContext ctx, LobbyOptions opts,
                std::unique_ptr<IAccrualPolicy> accrual = std::make_unique<OpenValveAccrual>());

    Outcome<Lobby> create_lobby(const Address& caller, Timestamp start_time, Amount bet_amount);
    Outcome<Lobby> update_start_time(const Address& caller, LobbyId lobby_id, Timestamp new_start_time);
    Outcome<Lobby> cancel_lobby(const Address& caller, LobbyId lobby_id);
    Outcome<Lobby> join_lobby(const Address& caller, LobbyId lobby_id);
    Outcome<Lobby> unjoin_lobby(const Address& caller, LobbyId lobby_id);
    Outcome<BreweryStatus> toggle_valve(const Address& caller, LobbyId lobby_id, bool open);

    std::optional<Lobby> get_lobby(LobbyId lobby_id) const;
    std::optional<LobbyPhase> phase(LobbyId lobby_id) const;
    std::size_t lobby_count() const { return store_.size(); }

    // Stored record, or a fresh one if the participant never touched the lobby.
    // nullopt only for an unknown lobby.
    std::optional<BreweryStatus> brewery_status(LobbyId lobby_id, const Address& participant) const;

    // Mead including production up to now (capped at the end of the in-progress
    // window). Read-only: nothing is checkpointed.
    std::optional<Amount> total_mead(LobbyId lobby_id, const Address& participant) const;

    std::size_t count_creator_lobbies(const Address& creator) const { return store_.created_by(creator).size(); }
    Page<LobbyId> creator_lobbies_page(const Address& creator, std::size_t cursor, std::size_t how_many) const;

    const Address& custody_address() const { return opts_.custody_address; }

private:
    // Lobby that is neither canceled nor started; the checks every pre-start write shares.
    Outcome<Lobby*> pending_lobby(const Address& caller, LobbyId lobby_id);
    BreweryStatus fresh_brewery(Timestamp now) const;

    EscrowContext ctx_;
    LobbyOptions opts_;
    std::unique_ptr<IAccrualPolicy> accrual_;
    LobbyStore store_;
};

#include "lobby/lobby_engine.hpp"

#include "core/operation.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace
{
    std::string lobby_ref(LobbyId id) { return "lobby " + std::to_string(id); }

    EscrowError not_found(LobbyId id)
    {
        return EscrowError{EscrowErrorCode::NotFound, lobby_ref(id) + " does not exist"};
    }

    EscrowError empty_caller()
    {
        return EscrowError{EscrowErrorCode::InvalidArgument, "caller address is empty"};
    }

    // Stakes are pulled into custody; the custody account never plays.
    EscrowError custody_caller()
    {
        return EscrowError{EscrowErrorCode::Unauthorized, "custody account cannot take part in lobbies"};
    }
}

LobbyEngine::LobbyEngine(EscrowContext ctx, LobbyOptions opts, std::unique_ptr<IAccrualPolicy> accrual)
    : ctx_(ctx), opts_(std::move(opts)), accrual_(std::move(accrual))
{
    if (!accrual_) accrual_ = std::make_unique<OpenValveAccrual>();
}

Outcome<Lobby> LobbyEngine::create_lobby(const Address& caller, Timestamp start_time, Amount bet_amount)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();
    const Timestamp now = ctx_.clock.now();
    if (start_time <= now) {
        return EscrowError{EscrowErrorCode::TimingViolation, "start time must be in the future"};
    }

    return run_in_scope<Lobby>({&ctx_.value}, [&](OperationScope& scope) {
        Lobby l;
        l.creator = caller;
        l.start_time = start_time;
        l.bet_amount = bet_amount;

        const LobbyId id = store_.append(std::move(l));
        scope.on_rollback([this] { store_.drop_last(); });

        ctx_.value.transfer_from(opts_.custody_address, caller, opts_.custody_address, bet_amount);

        ctx_.events.publish(LobbyCreated{id, caller, start_time, bet_amount});
        return *store_.find(id);
    });
}

Outcome<Lobby> LobbyEngine::update_start_time(const Address& caller, LobbyId lobby_id, Timestamp new_start_time)
{
    auto found = pending_lobby(caller, lobby_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Lobby* lobby = std::get<Lobby*>(found);

    if (lobby->creator != caller) {
        return EscrowError{EscrowErrorCode::Unauthorized, "caller is not the creator of " + lobby_ref(lobby_id)};
    }
    if (new_start_time <= ctx_.clock.now()) {
        return EscrowError{EscrowErrorCode::TimingViolation, "start time must be in the future"};
    }

    return run_in_scope<Lobby>({}, [&](OperationScope& scope) {
        const Timestamp before = lobby->start_time;
        lobby->start_time = new_start_time;
        scope.on_rollback([lobby, before] { lobby->start_time = before; });

        ctx_.events.publish(LobbyUpdated{lobby->id, lobby->creator, new_start_time});
        return *lobby;
    });
}

Outcome<Lobby> LobbyEngine::cancel_lobby(const Address& caller, LobbyId lobby_id)
{
    auto found = pending_lobby(caller, lobby_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Lobby* lobby = std::get<Lobby*>(found);

    if (lobby->creator != caller) {
        return EscrowError{EscrowErrorCode::Unauthorized, "caller is not the creator of " + lobby_ref(lobby_id)};
    }

    return run_in_scope<Lobby>({&ctx_.value}, [&](OperationScope& scope) {
        lobby->is_canceled = true;
        scope.on_rollback([lobby] { lobby->is_canceled = false; });

        const Address& custody = opts_.custody_address;
        ctx_.value.transfer(custody, lobby->creator, lobby->bet_amount);
        if (lobby->joiner) {
            ctx_.value.transfer(custody, *lobby->joiner, lobby->bet_amount);
        }

        ctx_.events.publish(LobbyCanceled{lobby->id, lobby->creator, lobby->joiner});
        return *lobby;
    });
}

Outcome<Lobby> LobbyEngine::join_lobby(const Address& caller, LobbyId lobby_id)
{
    auto found = pending_lobby(caller, lobby_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Lobby* lobby = std::get<Lobby*>(found);

    if (lobby->joiner) {
        return EscrowError{EscrowErrorCode::AlreadyInState, lobby_ref(lobby_id) + " already has a joiner"};
    }
    if (lobby->creator == caller) {
        return EscrowError{EscrowErrorCode::Unauthorized, "creator cannot join their own " + lobby_ref(lobby_id)};
    }

    return run_in_scope<Lobby>({&ctx_.value}, [&](OperationScope& scope) {
        lobby->joiner = caller;
        scope.on_rollback([lobby] { lobby->joiner.reset(); });

        ctx_.value.transfer_from(opts_.custody_address, caller, opts_.custody_address, lobby->bet_amount);

        ctx_.events.publish(LobbyJoined{lobby->id, caller});
        return *lobby;
    });
}

Outcome<Lobby> LobbyEngine::unjoin_lobby(const Address& caller, LobbyId lobby_id)
{
    auto found = pending_lobby(caller, lobby_id);
    if (auto* err = std::get_if<EscrowError>(&found)) return std::move(*err);
    Lobby* lobby = std::get<Lobby*>(found);

    if (!lobby->joiner) {
        return EscrowError{EscrowErrorCode::InvalidState, lobby_ref(lobby_id) + " has no joiner"};
    }
    if (*lobby->joiner != caller) {
        return EscrowError{EscrowErrorCode::Unauthorized, "caller is not the joiner of " + lobby_ref(lobby_id)};
    }
    if (lobby->start_time - ctx_.clock.now() <= kUnjoinGuardSeconds) {
        return EscrowError{EscrowErrorCode::TimingViolation,
                           "unjoin closes " + std::to_string(kUnjoinGuardSeconds) + "s before start"};
    }

    return run_in_scope<Lobby>({&ctx_.value}, [&](OperationScope& scope) {
        const Address joiner = *lobby->joiner;
        lobby->joiner.reset();
        scope.on_rollback([lobby, joiner] { lobby->joiner = joiner; });

        ctx_.value.transfer(opts_.custody_address, joiner, lobby->bet_amount);

        ctx_.events.publish(LobbyUnjoined{lobby->id, joiner});
        return *lobby;
    });
}

Outcome<BreweryStatus> LobbyEngine::toggle_valve(const Address& caller, LobbyId lobby_id, bool open)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();

    Lobby* lobby = store_.find(lobby_id);
    if (!lobby) return not_found(lobby_id);
    if (lobby->is_canceled) {
        return EscrowError{EscrowErrorCode::InvalidState, lobby_ref(lobby_id) + " is canceled"};
    }
    if (!lobby->joiner) {
        return EscrowError{EscrowErrorCode::InvalidState, lobby_ref(lobby_id) + " has no joiner"};
    }

    const Timestamp now = ctx_.clock.now();
    if (now < lobby->start_time || now >= lobby->start_time + kInProgressSeconds) {
        return EscrowError{EscrowErrorCode::TimingViolation, lobby_ref(lobby_id) + " is not in progress"};
    }
    if (caller != lobby->creator && caller != *lobby->joiner) {
        return EscrowError{EscrowErrorCode::Unauthorized, "caller does not play in " + lobby_ref(lobby_id)};
    }

    const BreweryStatus* existing = store_.brewery(lobby_id, caller);
    const bool currently_open = existing ? existing->is_valve_opened : false;
    if (currently_open == open) {
        return EscrowError{EscrowErrorCode::AlreadyInState,
                           std::string("valve is already ") + (open ? "open" : "closed")};
    }

    return run_in_scope<BreweryStatus>({}, [&](OperationScope& scope) {
        std::optional<BreweryStatus> before;
        if (existing) before = *existing;

        BreweryStatus next = existing ? *existing : fresh_brewery(now);
        accrual_->checkpoint(next, now);
        next.is_valve_opened = open;
        store_.put_brewery(lobby_id, caller, next);

        scope.on_rollback([this, lobby_id, caller, before] {
            if (before) store_.put_brewery(lobby_id, caller, *before);
            else store_.erase_brewery(lobby_id, caller);
        });

        ctx_.events.publish(ValveToggled{lobby_id, caller, open, now});
        return next;
    });
}

std::optional<Lobby> LobbyEngine::get_lobby(LobbyId lobby_id) const
{
    const Lobby* l = store_.find(lobby_id);
    if (!l) return std::nullopt;
    return *l;
}

std::optional<LobbyPhase> LobbyEngine::phase(LobbyId lobby_id) const
{
    const Lobby* l = store_.find(lobby_id);
    if (!l) return std::nullopt;
    return phase_of(*l, ctx_.clock.now());
}

std::optional<BreweryStatus> LobbyEngine::brewery_status(LobbyId lobby_id, const Address& participant) const
{
    if (!store_.find(lobby_id)) return std::nullopt;
    const BreweryStatus* s = store_.brewery(lobby_id, participant);
    if (!s) {
        BreweryStatus fresh;
        fresh.mead_per_second = opts_.mead_per_second;
        return fresh;
    }
    return *s;
}

std::optional<Amount> LobbyEngine::total_mead(LobbyId lobby_id, const Address& participant) const
{
    const Lobby* l = store_.find(lobby_id);
    if (!l) return std::nullopt;
    const BreweryStatus* s = store_.brewery(lobby_id, participant);
    if (!s) return Amount{0};

    BreweryStatus projected = *s;
    const Timestamp until = std::min(ctx_.clock.now(), l->start_time + kInProgressSeconds);
    if (until > projected.last_updated_at) {
        accrual_->checkpoint(projected, until);
    }
    return projected.mead;
}

Page<LobbyId> LobbyEngine::creator_lobbies_page(const Address& creator, std::size_t cursor,
                                                std::size_t how_many) const
{
    return fetch_page(store_.created_by(creator), cursor, how_many);
}

Outcome<Lobby*> LobbyEngine::pending_lobby(const Address& caller, LobbyId lobby_id)
{
    if (caller.empty()) return empty_caller();
    if (caller == opts_.custody_address) return custody_caller();

    Lobby* lobby = store_.find(lobby_id);
    if (!lobby) return not_found(lobby_id);
    if (lobby->is_canceled) {
        return EscrowError{EscrowErrorCode::InvalidState, lobby_ref(lobby_id) + " is canceled"};
    }
    if (has_started(*lobby, ctx_.clock.now())) {
        return EscrowError{EscrowErrorCode::TimingViolation, lobby_ref(lobby_id) + " has already started"};
    }
    return lobby;
}

BreweryStatus LobbyEngine::fresh_brewery(Timestamp now) const
{
    BreweryStatus s;
    s.last_updated_at = now;
    s.mead_per_second = opts_.mead_per_second;
    return s;
}

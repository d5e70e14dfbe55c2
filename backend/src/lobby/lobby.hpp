#pragma once
#include <optional>

#include "core/types.hpp"

// Unjoin closes this many seconds before the start time.
constexpr Timestamp kUnjoinGuardSeconds = 60;
// Length of the in-progress window that opens at the start time.
constexpr Timestamp kInProgressSeconds = 5 * 60;

struct Lobby {
    LobbyId id{0};                 // sequential from 1
    Address creator;
    std::optional<Address> joiner;
    bool is_canceled{false};
    Timestamp start_time{0};
    Amount bet_amount{0};
    Amount creator_mead_in_land{0};
    Amount joiner_mead_in_land{0};
};

enum class LobbyPhase { OPEN, JOINED, IN_PROGRESS, ENDED, CANCELED };

inline const char* to_cstr(LobbyPhase p) {
    switch (p) {
        case LobbyPhase::OPEN:        return "OPEN";
        case LobbyPhase::JOINED:      return "JOINED";
        case LobbyPhase::IN_PROGRESS: return "IN_PROGRESS";
        case LobbyPhase::ENDED:       return "ENDED";
        case LobbyPhase::CANCELED:    return "CANCELED";
    }
    return "?";
}

inline bool has_started(const Lobby& l, Timestamp now) { return l.start_time <= now; }

inline LobbyPhase phase_of(const Lobby& l, Timestamp now) {
    if (l.is_canceled) return LobbyPhase::CANCELED;
    if (!has_started(l, now)) return l.joiner ? LobbyPhase::JOINED : LobbyPhase::OPEN;
    if (l.joiner && now < l.start_time + kInProgressSeconds) return LobbyPhase::IN_PROGRESS;
    return LobbyPhase::ENDED;
}

// Per-participant production state inside one lobby.
struct BreweryStatus {
    Amount mead{0};
    Amount points{0};
    bool is_valve_opened{false};
    Timestamp last_updated_at{0};
    Amount mead_per_second{0};
};

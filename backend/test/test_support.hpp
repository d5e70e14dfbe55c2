#pragma once
#include <memory>
#include <stdexcept>
#include <variant>

#include "core/clock.hpp"
#include "core/context.hpp"
#include "events/event_log.hpp"
#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"
#include "lobby/lobby_engine.hpp"
#include "market/order_market.hpp"
#include "settings/settings_provider.hpp"

// Ledgers, settings, clock and event log wired the way the server wires them.
struct Harness {
    static constexpr Timestamp kT0 = 1'700'000'000;

    MemoryValueLedger ledger;
    MemoryAssetRegistry assets;
    StaticSettings settings{StaticSettings::Values{500, 3000, "treasury", "reward-pool"}};
    ManualClock clock{kT0};
    MemoryEventLog events;

    EscrowContext ctx() { return EscrowContext{ledger, assets, settings, clock, events}; }
};

// Sink that refuses every event.
class FailingSink final : public IEventSink {
public:
    void publish(const Event&) override { throw EventSinkError("journal offline"); }
};

template <typename T>
bool ok(const Outcome<T>& out) { return std::holds_alternative<T>(out); }

template <typename T>
const T& value(const Outcome<T>& out) { return std::get<T>(out); }

template <typename T>
EscrowErrorCode code(const Outcome<T>& out) { return std::get<EscrowError>(out).code; }

#pragma once

#include "core/clock.hpp"
#include "core/events.hpp"
#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"
#include "settings/settings_provider.hpp"

// Collaborators an engine works through. Built once per deployment and handed
// to each engine; the engine does not own any of them.
struct EscrowContext {
    IValueLedger& value;
    IAssetRegistry& assets;
    const ISettingsProvider& settings;
    const IClock& clock;
    IEventSink& events;
};

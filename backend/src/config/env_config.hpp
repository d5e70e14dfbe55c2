#pragma once
#include <cstdint>
#include <string>

#include "core/types.hpp"
#include "settings/settings_provider.hpp"

// Loads KEY=VALUE lines from `filepath` (falling back to backend/<filepath>)
// into the environment. Variables already set are left alone.
void load_env_file(const std::string& filepath = ".env");

struct ExchangeConfig {
    StaticSettings::Values settings;
    Address market_custody{"escrow:market"};
    Address lobby_custody{"escrow:lobby"};
    Amount mead_per_second{0};
    std::string db_url;      // empty: no PostgreSQL event journal
    std::string db_schema_path{"backend/src/db/schema/build_tables.sql"};
    std::uint16_t http_port{8080};
    bool dev_routes{false};
};

// Reads ESCROW_* variables. Throws std::runtime_error on malformed or missing values.
ExchangeConfig load_config_from_env();

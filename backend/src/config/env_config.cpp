#include "config/env_config.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace
{
    std::string trim(std::string s)
    {
        s.erase(0, s.find_first_not_of(" \t\r"));
        const auto last = s.find_last_not_of(" \t\r");
        s.erase(last == std::string::npos ? 0 : last + 1);
        return s;
    }

    std::string unquote(std::string v)
    {
        if (v.size() >= 2 && ((v.front() == '"' && v.back() == '"') ||
                              (v.front() == '\'' && v.back() == '\''))) {
            return v.substr(1, v.size() - 2);
        }
        return v;
    }

    const char* env(const char* name)
    {
        const char* v = std::getenv(name);
        return (v && *v) ? v : nullptr;
    }

    std::string env_string(const char* name, const std::string& fallback)
    {
        const char* v = env(name);
        return v ? std::string(v) : fallback;
    }

    std::uint64_t env_u64(const char* name, std::uint64_t fallback, std::uint64_t max)
    {
        const char* v = env(name);
        if (!v) return fallback;
        const std::string s = trim(v);
        if (s.empty() || s.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error(std::string(name) + " must be a non-negative integer, got '" + v + "'");
        }
        errno = 0;
        const unsigned long long parsed = std::strtoull(s.c_str(), nullptr, 10);
        if (errno == ERANGE || parsed > max) {
            throw std::runtime_error(std::string(name) + " is out of range: " + s);
        }
        return parsed;
    }

    bool env_flag(const char* name)
    {
        const std::string v = env_string(name, "");
        return v == "1" || v == "true" || v == "yes" || v == "on";
    }

    std::string require(const char* name)
    {
        const char* v = env(name);
        if (!v) throw std::runtime_error(std::string(name) + " is required");
        return v;
    }
}

void load_env_file(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open()) {
        // Try in backend directory if not found
        file.open("backend/" + filepath);
        if (!file.is_open()) {
            return; // .env file not found, will use system env vars
        }
    }

    std::string line;
    while (std::getline(file, line)) {
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        const std::string key = trim(line.substr(0, eq_pos));
        const std::string value = unquote(trim(line.substr(eq_pos + 1)));
        if (key.empty()) {
            continue;
        }

        // 0 = don't overwrite existing
        setenv(key.c_str(), value.c_str(), 0);
    }
}

ExchangeConfig load_config_from_env()
{
    ExchangeConfig cfg;

    cfg.settings.fee_rate = static_cast<std::uint32_t>(
        env_u64("ESCROW_FEE_RATE_BPS", cfg.settings.fee_rate, kBasisPointsDenominator));
    cfg.settings.treasury_fee_rate = static_cast<std::uint32_t>(
        env_u64("ESCROW_TREASURY_FEE_RATE_BPS", cfg.settings.treasury_fee_rate, kBasisPointsDenominator));
    cfg.settings.treasury_address = require("ESCROW_TREASURY_ADDRESS");
    cfg.settings.reward_pool_address = require("ESCROW_REWARD_POOL_ADDRESS");

    cfg.market_custody = env_string("ESCROW_MARKET_CUSTODY", cfg.market_custody);
    cfg.lobby_custody = env_string("ESCROW_LOBBY_CUSTODY", cfg.lobby_custody);
    if (cfg.market_custody == cfg.lobby_custody) {
        throw std::runtime_error("ESCROW_MARKET_CUSTODY and ESCROW_LOBBY_CUSTODY must differ");
    }

    cfg.mead_per_second = env_u64("ESCROW_MEAD_PER_SECOND", cfg.mead_per_second,
                                  std::numeric_limits<Amount>::max());
    cfg.db_url = env_string("ESCROW_DB_URL", "");
    cfg.db_schema_path = env_string("ESCROW_DB_SCHEMA", cfg.db_schema_path);
    cfg.http_port = static_cast<std::uint16_t>(
        env_u64("ESCROW_HTTP_PORT", cfg.http_port, std::numeric_limits<std::uint16_t>::max()));
    cfg.dev_routes = env_flag("ESCROW_DEV_ROUTES");
    return cfg;
}

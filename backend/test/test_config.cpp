#include "config/env_config.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <stdexcept>
#include <string>

static bool config_throws() {
    try {
        (void)load_config_from_env();
    } catch (const std::runtime_error& e) {
        std::cout << "  rejected: " << e.what() << "\n";
        return true;
    }
    return false;
}

int main() {
    for (const char* name : {"ESCROW_TREASURY_ADDRESS", "ESCROW_REWARD_POOL_ADDRESS",
                             "ESCROW_TREASURY_FEE_RATE_BPS", "ESCROW_MARKET_CUSTODY",
                             "ESCROW_LOBBY_CUSTODY", "ESCROW_MEAD_PER_SECOND", "ESCROW_DB_URL",
                             "ESCROW_HTTP_PORT", "ESCROW_DEV_ROUTES"}) {
        unsetenv(name);
    }
    assert(config_throws());

    // .env values fill in what the environment lacks, without overriding it
    const std::string path = "test_config.env";
    {
        std::ofstream env(path);
        env << "# escrow settings\n"
            << "ESCROW_TREASURY_ADDRESS = \"0xtreasury\"\n"
            << "ESCROW_REWARD_POOL_ADDRESS='0xpool'\n"
            << "ESCROW_FEE_RATE_BPS=250\n"
            << "not a pair\n";
    }
    setenv("ESCROW_FEE_RATE_BPS", "700", 1);
    load_env_file(path);
    std::remove(path.c_str());

    ExchangeConfig cfg = load_config_from_env();
    assert(cfg.settings.treasury_address == "0xtreasury");
    assert(cfg.settings.reward_pool_address == "0xpool");
    assert(cfg.settings.fee_rate == 700);
    assert(cfg.settings.treasury_fee_rate == 3000);
    assert(cfg.market_custody == "escrow:market");
    assert(cfg.lobby_custody == "escrow:lobby");
    assert(cfg.http_port == 8080);
    assert(cfg.db_url.empty());
    assert(!cfg.dev_routes);

    setenv("ESCROW_DEV_ROUTES", "true", 1);
    setenv("ESCROW_HTTP_PORT", "9090", 1);
    setenv("ESCROW_MEAD_PER_SECOND", "12", 1);
    cfg = load_config_from_env();
    assert(cfg.dev_routes && cfg.http_port == 9090 && cfg.mead_per_second == 12);

    setenv("ESCROW_FEE_RATE_BPS", "10001", 1);
    assert(config_throws());
    setenv("ESCROW_FEE_RATE_BPS", "-5", 1);
    assert(config_throws());
    setenv("ESCROW_FEE_RATE_BPS", "5%", 1);
    assert(config_throws());
    setenv("ESCROW_FEE_RATE_BPS", "500", 1);

    setenv("ESCROW_HTTP_PORT", "70000", 1);
    assert(config_throws());
    setenv("ESCROW_HTTP_PORT", "8080", 1);

    setenv("ESCROW_LOBBY_CUSTODY", "escrow:market", 1);
    assert(config_throws());

    std::cout << "config OK\n";
    return 0;
}

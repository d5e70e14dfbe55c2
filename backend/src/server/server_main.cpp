#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "config/env_config.hpp"
#include "core/clock.hpp"
#include "core/context.hpp"
#include "db/pg_event_sink.hpp"
#include "events/event_log.hpp"
#include "exchange/exchange.hpp"
#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"
#include "server/http_routes.hpp"
#include "server/http_server.hpp"
#include "settings/settings_provider.hpp"

using tcp = boost::asio::ip::tcp;

int main() {
    // Load .env file
    load_env_file();

    ExchangeConfig cfg;
    std::unique_ptr<StaticSettings> settings;
    try {
        cfg = load_config_from_env();
        settings = std::make_unique<StaticSettings>(cfg.settings);
    } catch (const std::exception& e) {
        std::cerr << "[setup] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[setup] fee=" << settings->fee_rate() << "bps"
              << " treasury_share=" << settings->treasury_fee_rate() << "bps"
              << " treasury=" << settings->treasury_address()
              << " reward_pool=" << settings->reward_pool_address() << std::endl;

    // Ledgers are kept in process; the engines only see their interfaces.
    MemoryValueLedger ledger;
    MemoryAssetRegistry assets;
    SystemClock clock;

    // Durable journal first so a failed insert stops the in-memory log too.
    MemoryEventLog event_log;
    FanoutEventSink events;
    std::unique_ptr<IEventSink> pg_sink;
    if (!cfg.db_url.empty()) {
        try {
            pg_sink = make_pg_event_sink(cfg.db_url, cfg.db_schema_path);
            events.add(*pg_sink);
            std::cout << "[db] Event journal connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[db] Warning: Failed to initialize event journal: " << e.what() << std::endl;
            std::cerr << "[db] Server will continue with the in-memory event log only." << std::endl;
        }
    } else {
        std::cout << "[db] ESCROW_DB_URL not set; events kept in memory only" << std::endl;
    }
    events.add(event_log);

    EscrowContext ctx{ledger, assets, *settings, clock, events};
    MarketOptions market_opts;
    market_opts.custody_address = cfg.market_custody;
    LobbyOptions lobby_opts;
    lobby_opts.custody_address = cfg.lobby_custody;
    lobby_opts.mead_per_second = cfg.mead_per_second;
    Exchange exchange{ctx, market_opts, lobby_opts};

    RouteContext routes{exchange, event_log};
    if (cfg.dev_routes) {
        routes.dev_ledger = &ledger;
        routes.dev_assets = &assets;
        std::cout << "[setup] Dev funding routes enabled under /api/dev" << std::endl;
    }

    // Start HTTP server
    boost::asio::io_context ioc{1};
    try {
        tcp::endpoint ep{boost::asio::ip::make_address("0.0.0.0"), cfg.http_port};
        HttpServer server{ioc, ep, [&](auto const& req, auto& res){
            handle_request(routes, req, res);
        }};
        server.run();

        std::cout << "[setup] HTTP listening on :" << cfg.http_port << std::endl;
        ioc.run();
    } catch (const std::exception& e) {
        std::cerr << "[setup] HTTP server failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

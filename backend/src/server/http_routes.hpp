#pragma once
#include <boost/beast/http.hpp>

#include "events/event_log.hpp"
#include "exchange/exchange.hpp"
#include "ledger/asset_registry.hpp"
#include "ledger/value_ledger.hpp"

namespace http = boost::beast::http;

struct RouteContext {
    Exchange& exchange;
    const MemoryEventLog& event_log;
    // Set only when the dev funding routes are enabled.
    MemoryValueLedger* dev_ledger{nullptr};
    MemoryAssetRegistry* dev_assets{nullptr};
};

// JSON API over the exchange. Caller identity comes from the "caller" field of
// the request body (or query string for reads).
void handle_request(RouteContext& ctx,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res);

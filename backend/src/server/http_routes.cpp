#include "server/http_routes.hpp"

#include <boost/url.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "util/json_encode.hpp"

namespace urls = boost::urls;
using json = nlohmann::json;

namespace
{
    constexpr std::size_t kDefaultPageSize = 50;
    constexpr std::size_t kMaxPageSize = 500;

    // Malformed request; answered with 400.
    class BadRequest : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    using Query = std::unordered_map<std::string, std::string>;

    void reply(http::response<http::string_body>& res, http::status status, const json& body)
    {
        res.result(status);
        res.set(http::field::content_type, "application/json");
        // Invalid UTF-8 in stored strings is replaced rather than thrown from dump().
        res.body() = body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    http::status status_for(EscrowErrorCode code)
    {
        switch (code) {
            case EscrowErrorCode::NotFound:         return http::status::not_found;
            case EscrowErrorCode::Unauthorized:     return http::status::forbidden;
            case EscrowErrorCode::InvalidArgument:  return http::status::bad_request;
            case EscrowErrorCode::InvalidState:
            case EscrowErrorCode::TimingViolation:
            case EscrowErrorCode::AlreadyInState:
            case EscrowErrorCode::AmountMismatch:   return http::status::conflict;
            case EscrowErrorCode::TransferFailed:   return http::status::payment_required;
            case EscrowErrorCode::EventSinkFailure: return http::status::internal_server_error;
        }
        return http::status::internal_server_error;
    }

    template <typename T, typename Encode>
    void reply_outcome(http::response<http::string_body>& res, const Outcome<T>& out, Encode encode)
    {
        if (const auto* err = std::get_if<EscrowError>(&out)) {
            if (err->code == EscrowErrorCode::EventSinkFailure) {
                std::cerr << "[events] " << err->message << std::endl;
            }
            reply(res, status_for(err->code), error_json(*err));
            return;
        }
        reply(res, http::status::ok, encode(std::get<T>(out)));
    }

    json parse_body(const http::request<http::string_body>& req)
    {
        if (req.body().empty()) throw BadRequest("request body is required");
        json body = json::parse(req.body(), nullptr, false);
        if (body.is_discarded() || !body.is_object()) throw BadRequest("request body must be a JSON object");
        return body;
    }

    bool is_utf8(const std::string& s)
    {
        try {
            (void)json(s).dump();
        } catch (const json::type_error&) {
            return false;
        }
        return true;
    }

    Address require_address(const json& body, const char* key)
    {
        auto it = body.find(key);
        if (it == body.end() || !it->is_string() || it->get<std::string>().empty()) {
            throw BadRequest(std::string("'") + key + "' must be a non-empty string");
        }
        return it->get<std::string>();
    }

    Amount require_amount(const json& body, const char* key)
    {
        auto it = body.find(key);
        if (it == body.end() || !it->is_number_unsigned()) {
            throw BadRequest(std::string("'") + key + "' must be a non-negative integer");
        }
        return it->get<Amount>();
    }

    Timestamp require_timestamp(const json& body, const char* key)
    {
        auto it = body.find(key);
        if (it == body.end() || !it->is_number_integer()) {
            throw BadRequest(std::string("'") + key + "' must be an integer (unix seconds)");
        }
        if (it->is_number_unsigned() && it->get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
            throw BadRequest(std::string("'") + key + "' is out of range");
        }
        return it->get<Timestamp>();
    }

    bool require_bool(const json& body, const char* key)
    {
        auto it = body.find(key);
        if (it == body.end() || !it->is_boolean()) {
            throw BadRequest(std::string("'") + key + "' must be a boolean");
        }
        return it->get<bool>();
    }

    std::optional<std::uint64_t> parse_u64(std::string_view s)
    {
        std::uint64_t v = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec != std::errc{} || ptr != s.data() + s.size() || s.empty()) return std::nullopt;
        return v;
    }

    std::uint64_t require_id(const std::string& segment)
    {
        auto id = parse_u64(segment);
        if (!id) throw BadRequest("path segment is not a valid id");
        return *id;
    }

    std::string query_address(const Query& q)
    {
        auto it = q.find("address");
        if (it == q.end() || it->second.empty()) throw BadRequest("'address' query parameter is required");
        if (!is_utf8(it->second)) throw BadRequest("'address' query parameter must be valid UTF-8");
        return it->second;
    }

    std::size_t query_size(const Query& q, const char* key, std::size_t fallback, std::size_t max)
    {
        auto it = q.find(key);
        if (it == q.end()) return fallback;
        auto v = parse_u64(it->second);
        if (!v) throw BadRequest(std::string("'") + key + "' must be a non-negative integer");
        return static_cast<std::size_t>(std::min<std::uint64_t>(*v, max));
    }

    template <typename T>
    json page_json(const Page<T>& page, std::size_t total)
    {
        return json{{"items", page.items}, {"cursor", page.cursor}, {"total", total}};
    }

    json lobby_json(const Lobby& l, LobbyPhase phase)
    {
        json j = l;
        j["phase"] = to_cstr(phase);
        return j;
    }

    // ---------------------------------------------------------------------
    // /api/orders
    // ---------------------------------------------------------------------

    void route_orders(RouteContext& ctx, const http::request<http::string_body>& req,
                      const std::vector<std::string>& seg, const Query& q,
                      http::response<http::string_body>& res)
    {
        const bool is_get = req.method() == http::verb::get;
        const bool is_post = req.method() == http::verb::post;
        const auto order_json = [](const Order& o) { return json(o); };

        // POST /api/orders
        if (seg.size() == 2 && is_post) {
            const json body = parse_body(req);
            const Address caller = require_address(body, "caller");
            const AssetId asset_id = require_amount(body, "asset_id");
            const Amount price = require_amount(body, "price");
            auto out = ctx.exchange.market([&](OrderMarket& m) { return m.create_order(caller, asset_id, price); });
            return reply_outcome(res, out, order_json);
        }

        // GET /api/orders/owned, /api/orders/bought
        if (seg.size() == 3 && is_get && (seg[2] == "owned" || seg[2] == "bought")) {
            const Address address = query_address(q);
            const std::size_t cursor = query_size(q, "cursor", 0, SIZE_MAX);
            const std::size_t limit = query_size(q, "limit", kDefaultPageSize, kMaxPageSize);
            const bool owned = seg[2] == "owned";
            json body = ctx.exchange.market([&](OrderMarket& m) {
                return owned
                    ? page_json(m.owned_orders_page(address, cursor, limit), m.count_owned_orders(address))
                    : page_json(m.bought_orders_page(address, cursor, limit), m.count_bought_orders(address));
            });
            return reply(res, http::status::ok, body);
        }

        // GET /api/orders/{id}
        if (seg.size() == 3 && is_get) {
            const OrderId id = require_id(seg[2]);
            auto order = ctx.exchange.market([&](OrderMarket& m) { return m.get_order(id); });
            if (!order) {
                return reply(res, http::status::not_found,
                             error_json({EscrowErrorCode::NotFound, "order " + std::to_string(id) + " does not exist"}));
            }
            return reply(res, http::status::ok, json(*order));
        }

        // POST /api/orders/{id}/{price|cancel|buy}
        if (seg.size() == 4 && is_post) {
            const OrderId id = require_id(seg[2]);
            const json body = parse_body(req);
            const Address caller = require_address(body, "caller");
            const std::string& action = seg[3];

            if (action == "price") {
                const Amount price = require_amount(body, "price");
                auto out = ctx.exchange.market([&](OrderMarket& m) { return m.update_order(caller, id, price); });
                return reply_outcome(res, out, order_json);
            }
            if (action == "cancel") {
                auto out = ctx.exchange.market([&](OrderMarket& m) { return m.cancel_order(caller, id); });
                return reply_outcome(res, out, order_json);
            }
            if (action == "buy") {
                const Amount amount = require_amount(body, "amount");
                auto out = ctx.exchange.market([&](OrderMarket& m) { return m.buy_order(caller, id, amount); });
                return reply_outcome(res, out, [](const SaleReceipt& r) {
                    return json{{"order", r.order}, {"split", r.split}};
                });
            }
        }

        reply(res, http::status::not_found, json{{"error", "not found"}});
    }

    // ---------------------------------------------------------------------
    // /api/lobbies
    // ---------------------------------------------------------------------

    void route_lobbies(RouteContext& ctx, const http::request<http::string_body>& req,
                       const std::vector<std::string>& seg, const Query& q,
                       http::response<http::string_body>& res)
    {
        const bool is_get = req.method() == http::verb::get;
        const bool is_post = req.method() == http::verb::post;
        const auto as_json = [](const Lobby& l) { return json(l); };

        // POST /api/lobbies
        if (seg.size() == 2 && is_post) {
            const json body = parse_body(req);
            const Address caller = require_address(body, "caller");
            const Timestamp start_time = require_timestamp(body, "start_time");
            const Amount bet_amount = require_amount(body, "bet_amount");
            auto out = ctx.exchange.lobbies([&](LobbyEngine& e) {
                return e.create_lobby(caller, start_time, bet_amount);
            });
            return reply_outcome(res, out, as_json);
        }

        // GET /api/lobbies/created
        if (seg.size() == 3 && is_get && seg[2] == "created") {
            const Address address = query_address(q);
            const std::size_t cursor = query_size(q, "cursor", 0, SIZE_MAX);
            const std::size_t limit = query_size(q, "limit", kDefaultPageSize, kMaxPageSize);
            json body = ctx.exchange.lobbies([&](LobbyEngine& e) {
                return page_json(e.creator_lobbies_page(address, cursor, limit), e.count_creator_lobbies(address));
            });
            return reply(res, http::status::ok, body);
        }

        // GET /api/lobbies/{id}
        if (seg.size() == 3 && is_get) {
            const LobbyId id = require_id(seg[2]);
            auto body = ctx.exchange.lobbies([&](LobbyEngine& e) -> std::optional<json> {
                auto lobby = e.get_lobby(id);
                if (!lobby) return std::nullopt;
                return lobby_json(*lobby, *e.phase(id));
            });
            if (!body) {
                return reply(res, http::status::not_found,
                             error_json({EscrowErrorCode::NotFound, "lobby " + std::to_string(id) + " does not exist"}));
            }
            return reply(res, http::status::ok, *body);
        }

        // GET /api/lobbies/{id}/brewery?address=
        if (seg.size() == 4 && is_get && seg[3] == "brewery") {
            const LobbyId id = require_id(seg[2]);
            const Address address = query_address(q);
            auto body = ctx.exchange.lobbies([&](LobbyEngine& e) -> std::optional<json> {
                auto status = e.brewery_status(id, address);
                if (!status) return std::nullopt;
                json j = *status;
                j["total_mead"] = *e.total_mead(id, address);
                return j;
            });
            if (!body) {
                return reply(res, http::status::not_found,
                             error_json({EscrowErrorCode::NotFound, "lobby " + std::to_string(id) + " does not exist"}));
            }
            return reply(res, http::status::ok, *body);
        }

        // POST /api/lobbies/{id}/{start_time|cancel|join|unjoin|valve}
        if (seg.size() == 4 && is_post) {
            const LobbyId id = require_id(seg[2]);
            const json body = parse_body(req);
            const Address caller = require_address(body, "caller");
            const std::string& action = seg[3];

            if (action == "start_time") {
                const Timestamp start_time = require_timestamp(body, "start_time");
                auto out = ctx.exchange.lobbies([&](LobbyEngine& e) {
                    return e.update_start_time(caller, id, start_time);
                });
                return reply_outcome(res, out, as_json);
            }
            if (action == "cancel") {
                auto out = ctx.exchange.lobbies([&](LobbyEngine& e) { return e.cancel_lobby(caller, id); });
                return reply_outcome(res, out, as_json);
            }
            if (action == "join") {
                auto out = ctx.exchange.lobbies([&](LobbyEngine& e) { return e.join_lobby(caller, id); });
                return reply_outcome(res, out, as_json);
            }
            if (action == "unjoin") {
                auto out = ctx.exchange.lobbies([&](LobbyEngine& e) { return e.unjoin_lobby(caller, id); });
                return reply_outcome(res, out, as_json);
            }
            if (action == "valve") {
                const bool open = require_bool(body, "open");
                auto out = ctx.exchange.lobbies([&](LobbyEngine& e) { return e.toggle_valve(caller, id, open); });
                return reply_outcome(res, out, [](const BreweryStatus& s) { return json(s); });
            }
        }

        reply(res, http::status::not_found, json{{"error", "not found"}});
    }

    // ---------------------------------------------------------------------
    // /api/dev: funding helpers for the in-memory ledgers
    // ---------------------------------------------------------------------

    void route_dev(RouteContext& ctx, const http::request<http::string_body>& req,
                   const std::vector<std::string>& seg, const Query& q,
                   http::response<http::string_body>& res)
    {
        if (!ctx.dev_ledger || !ctx.dev_assets || seg.size() != 3) {
            return reply(res, http::status::not_found, json{{"error", "not found"}});
        }
        MemoryValueLedger& ledger = *ctx.dev_ledger;
        MemoryAssetRegistry& assets = *ctx.dev_assets;
        const std::string& action = seg[2];

        if (req.method() == http::verb::get && action == "balance") {
            const Address address = query_address(q);
            const Amount balance = ctx.exchange.host([&] { return ledger.balance_of(address); });
            return reply(res, http::status::ok, json{{"address", address}, {"balance", balance}});
        }
        if (req.method() != http::verb::post) {
            return reply(res, http::status::not_found, json{{"error", "not found"}});
        }

        const json body = parse_body(req);
        try {
            if (action == "fund") {
                const Address to = require_address(body, "address");
                const Amount amount = require_amount(body, "amount");
                ctx.exchange.host([&] { ledger.mint(to, amount); });
            } else if (action == "approve") {
                const Address owner = require_address(body, "owner");
                const Address spender = require_address(body, "spender");
                const Amount amount = require_amount(body, "amount");
                ctx.exchange.host([&] { ledger.approve(owner, spender, amount); });
            } else if (action == "mint_asset") {
                const Address owner = require_address(body, "owner");
                const AssetId asset_id = require_amount(body, "asset_id");
                ctx.exchange.host([&] { assets.mint(owner, asset_id); });
            } else if (action == "approve_all") {
                const Address owner = require_address(body, "owner");
                const Address op = require_address(body, "operator");
                const bool approved = require_bool(body, "approved");
                ctx.exchange.host([&] { assets.set_approval_for_all(owner, op, approved); });
            } else {
                return reply(res, http::status::not_found, json{{"error", "not found"}});
            }
        } catch (const LedgerError& e) {
            return reply(res, http::status::bad_request,
                         error_json({EscrowErrorCode::InvalidArgument, e.what()}));
        }
        reply(res, http::status::ok, json{{"status", "ok"}});
    }
}

void handle_request(RouteContext& ctx,
                    const http::request<http::string_body>& req,
                    http::response<http::string_body>& res)
{
    // Parse the target as an origin-form URL
    std::string_view target{req.target().data(), req.target().size()};
    auto parsed_result = urls::parse_origin_form(target);
    if (!parsed_result) {
        return reply(res, http::status::bad_request, json{{"error", "bad request"}});
    }
    urls::url_view url = *parsed_result;

    std::vector<std::string> seg;
    for (auto s : url.segments()) {
        if (!s.empty()) seg.push_back(std::string(s));
    }
    Query q;
    for (auto const& p : url.params()) {
        q[std::string(p.key)] = std::string(p.value);
    }

    if (seg.size() < 2 || seg[0] != "api") {
        return reply(res, http::status::not_found, json{{"error", "not found"}});
    }

    try {
        const std::string& area = seg[1];

        // /api/health
        if (area == "health" && req.method() == http::verb::get) {
            return reply(res, http::status::ok, json{{"status", "ok"}});
        }

        if (area == "orders") return route_orders(ctx, req, seg, q, res);
        if (area == "lobbies") return route_lobbies(ctx, req, seg, q, res);
        if (area == "dev") return route_dev(ctx, req, seg, q, res);

        // /api/events?cursor=&limit=
        if (area == "events" && req.method() == http::verb::get) {
            const std::size_t cursor = query_size(q, "cursor", 0, SIZE_MAX);
            const std::size_t limit = query_size(q, "limit", kDefaultPageSize, kMaxPageSize);
            json body = ctx.exchange.host([&] {
                const auto page = ctx.event_log.page(cursor, limit);
                json items = json::array();
                for (const auto& ev : page.items) items.push_back(event_json(ev));
                return json{{"items", items}, {"cursor", page.cursor}, {"total", ctx.event_log.size()}};
            });
            return reply(res, http::status::ok, body);
        }
    } catch (const BadRequest& e) {
        return reply(res, http::status::bad_request,
                     error_json({EscrowErrorCode::InvalidArgument, e.what()}));
    } catch (const std::exception& e) {
        std::cerr << "[http] " << req.method_string() << " " << req.target()
                  << " failed: " << e.what() << std::endl;
        return reply(res, http::status::internal_server_error,
                     json{{"error", "internal"}, {"message", e.what()}});
    }

    // 404
    reply(res, http::status::not_found, json{{"error", "not found"}});
}

#pragma once
#include <nlohmann/json.hpp>

#include <optional>
#include <variant>

#include "core/error.hpp"
#include "core/events.hpp"
#include "lobby/lobby.hpp"
#include "market/fee_split.hpp"
#include "market/order.hpp"

// nlohmann::json adapters for the records the API and the event sinks emit.
// Optional addresses encode as null.

inline nlohmann::json optional_address(const std::optional<Address>& a) {
    return a ? nlohmann::json(*a) : nlohmann::json(nullptr);
}

inline void to_json(nlohmann::json& j, const Order& o) {
    j = nlohmann::json{
        {"id", o.id},
        {"status", to_cstr(o.status)},
        {"asset_id", o.asset_id},
        {"seller", o.seller},
        {"buyer", optional_address(o.buyer)},
        {"price", o.price},
    };
}

inline void to_json(nlohmann::json& j, const FeeSplit& s) {
    j = nlohmann::json{
        {"tax", s.tax},
        {"treasury_amount", s.treasury_amount},
        {"reward_pool_amount", s.reward_pool_amount},
        {"seller_amount", s.seller_amount},
    };
}

inline void to_json(nlohmann::json& j, const Lobby& l) {
    j = nlohmann::json{
        {"id", l.id},
        {"creator", l.creator},
        {"joiner", optional_address(l.joiner)},
        {"is_canceled", l.is_canceled},
        {"start_time", l.start_time},
        {"bet_amount", l.bet_amount},
        {"creator_mead_in_land", l.creator_mead_in_land},
        {"joiner_mead_in_land", l.joiner_mead_in_land},
    };
}

inline void to_json(nlohmann::json& j, const BreweryStatus& s) {
    j = nlohmann::json{
        {"mead", s.mead},
        {"points", s.points},
        {"is_valve_opened", s.is_valve_opened},
        {"last_updated_at", s.last_updated_at},
        {"mead_per_second", s.mead_per_second},
    };
}

inline nlohmann::json error_json(const EscrowError& e) {
    return nlohmann::json{{"error", to_cstr(e.code)}, {"message", e.message}};
}

// {"kind": "<EventName>", ...fields}
inline nlohmann::json event_json(const Event& ev) {
    struct Visitor {
        nlohmann::json operator()(const OrderCreated& e) const {
            return {{"order_id", e.order_id}, {"asset_id", e.asset_id}, {"seller", e.seller}, {"price", e.price}};
        }
        nlohmann::json operator()(const OrderUpdated& e) const {
            return {{"order_id", e.order_id}, {"seller", e.seller}, {"price", e.price}};
        }
        nlohmann::json operator()(const OrderCanceled& e) const {
            return {{"order_id", e.order_id}, {"asset_id", e.asset_id}, {"seller", e.seller}};
        }
        nlohmann::json operator()(const OrderBought& e) const {
            return {{"order_id", e.order_id}, {"asset_id", e.asset_id},
                    {"seller", e.seller}, {"buyer", e.buyer}, {"price", e.price},
                    {"seller_amount", e.seller_amount},
                    {"treasury_amount", e.treasury_amount},
                    {"reward_pool_amount", e.reward_pool_amount}};
        }
        nlohmann::json operator()(const LobbyCreated& e) const {
            return {{"lobby_id", e.lobby_id}, {"creator", e.creator},
                    {"start_time", e.start_time}, {"bet_amount", e.bet_amount}};
        }
        nlohmann::json operator()(const LobbyUpdated& e) const {
            return {{"lobby_id", e.lobby_id}, {"creator", e.creator}, {"start_time", e.start_time}};
        }
        nlohmann::json operator()(const LobbyCanceled& e) const {
            return {{"lobby_id", e.lobby_id}, {"creator", e.creator}, {"joiner", optional_address(e.joiner)}};
        }
        nlohmann::json operator()(const LobbyJoined& e) const {
            return {{"lobby_id", e.lobby_id}, {"joiner", e.joiner}};
        }
        nlohmann::json operator()(const LobbyUnjoined& e) const {
            return {{"lobby_id", e.lobby_id}, {"joiner", e.joiner}};
        }
        nlohmann::json operator()(const ValveToggled& e) const {
            return {{"lobby_id", e.lobby_id}, {"participant", e.participant},
                    {"opened", e.opened}, {"at", e.at}};
        }
    };
    nlohmann::json j = std::visit(Visitor{}, ev);
    j["kind"] = event_kind(ev);
    return j;
}

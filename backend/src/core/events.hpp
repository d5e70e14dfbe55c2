#pragma once
#include <optional>
#include <variant>

#include "core/types.hpp"

struct OrderCreated {
    OrderId order_id{0};
    AssetId asset_id{0};
    Address seller;
    Amount price{0};
};

struct OrderUpdated {
    OrderId order_id{0};
    Address seller;
    Amount price{0};
};

struct OrderCanceled {
    OrderId order_id{0};
    AssetId asset_id{0};
    Address seller;
};

struct OrderBought {
    OrderId order_id{0};
    AssetId asset_id{0};
    Address seller;
    Address buyer;
    Amount price{0};
    Amount seller_amount{0};
    Amount treasury_amount{0};
    Amount reward_pool_amount{0};
};

struct LobbyCreated {
    LobbyId lobby_id{0};
    Address creator;
    Timestamp start_time{0};
    Amount bet_amount{0};
};

struct LobbyUpdated {
    LobbyId lobby_id{0};
    Address creator;
    Timestamp start_time{0};
};

struct LobbyCanceled {
    LobbyId lobby_id{0};
    Address creator;
    std::optional<Address> joiner;
};

struct LobbyJoined {
    LobbyId lobby_id{0};
    Address joiner;
};

struct LobbyUnjoined {
    LobbyId lobby_id{0};
    Address joiner;
};

struct ValveToggled {
    LobbyId lobby_id{0};
    Address participant;
    bool opened{false};
    Timestamp at{0};
};

using Event = std::variant<
    OrderCreated, OrderUpdated, OrderCanceled, OrderBought,
    LobbyCreated, LobbyUpdated, LobbyCanceled, LobbyJoined, LobbyUnjoined,
    ValveToggled>;

inline const char* event_kind(const Event& ev) {
    struct Visitor {
        const char* operator()(const OrderCreated&) const  { return "OrderCreated"; }
        const char* operator()(const OrderUpdated&) const  { return "OrderUpdated"; }
        const char* operator()(const OrderCanceled&) const { return "OrderCanceled"; }
        const char* operator()(const OrderBought&) const   { return "OrderBought"; }
        const char* operator()(const LobbyCreated&) const  { return "LobbyCreated"; }
        const char* operator()(const LobbyUpdated&) const  { return "LobbyUpdated"; }
        const char* operator()(const LobbyCanceled&) const { return "LobbyCanceled"; }
        const char* operator()(const LobbyJoined&) const   { return "LobbyJoined"; }
        const char* operator()(const LobbyUnjoined&) const { return "LobbyUnjoined"; }
        const char* operator()(const ValveToggled&) const  { return "ValveToggled"; }
    };
    return std::visit(Visitor{}, ev);
}

// Receives one event per committed write. Implementations throw EventSinkError
// when the event cannot be recorded; the publishing operation is then undone.
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void publish(const Event& ev) = 0;
};

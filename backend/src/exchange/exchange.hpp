#pragma once
#include <mutex>
#include <utility>

#include "core/context.hpp"
#include "lobby/lobby_engine.hpp"
#include "market/order_market.hpp"

// Both engines behind one lock. Every read and write goes through
// market()/lobbies()/host(), which gives callers a single global order of
// operations over the shared ledgers.
class Exchange {
public:
    Exchange(EscrowContext ctx, MarketOptions market_opts, LobbyOptions lobby_opts)
        : market_(ctx, std::move(market_opts)),
          lobbies_(ctx, std::move(lobby_opts)) {}

    template <typename Fn>
    auto market(Fn&& fn) {
        std::lock_guard<std::mutex> lk(m_);
        return std::forward<Fn>(fn)(market_);
    }

    template <typename Fn>
    auto lobbies(Fn&& fn) {
        std::lock_guard<std::mutex> lk(m_);
        return std::forward<Fn>(fn)(lobbies_);
    }

    // Serialized access for anything else touching the shared ledgers.
    template <typename Fn>
    auto host(Fn&& fn) {
        std::lock_guard<std::mutex> lk(m_);
        return std::forward<Fn>(fn)();
    }

private:
    std::mutex m_;
    OrderMarket market_;
    LobbyEngine lobbies_;
};

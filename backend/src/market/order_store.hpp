#pragma once
#include <cstddef>
#include <unordered_map>
#include <utility>
#include <vector>

#include "market/order.hpp"

// Append-only order arena with per-seller and per-buyer id indices. Indices keep
// insertion order and refer back by id only.
class OrderStore {
public:
    // Assigns the next id and stores the order.
    OrderId append(Order o) {
        o.id = static_cast<OrderId>(orders_.size());
        orders_.push_back(std::move(o));
        return orders_.back().id;
    }

    // Undo of the latest append, used when the creating operation is rolled back.
    void drop_last() {
        if (!orders_.empty()) orders_.pop_back();
    }

    Order* find(OrderId id) {
        return id < orders_.size() ? &orders_[static_cast<std::size_t>(id)] : nullptr;
    }
    const Order* find(OrderId id) const {
        return id < orders_.size() ? &orders_[static_cast<std::size_t>(id)] : nullptr;
    }

    std::size_t size() const { return orders_.size(); }

    void index_owned(const Address& seller, OrderId id) { owned_[seller].push_back(id); }
    void unindex_owned(const Address& seller) { pop_index(owned_, seller); }
    void index_bought(const Address& buyer, OrderId id) { bought_[buyer].push_back(id); }
    void unindex_bought(const Address& buyer) { pop_index(bought_, buyer); }

    const std::vector<OrderId>& owned(const Address& seller) const { return lookup(owned_, seller); }
    const std::vector<OrderId>& bought(const Address& buyer) const { return lookup(bought_, buyer); }

private:
    using Index = std::unordered_map<Address, std::vector<OrderId>>;

    static void pop_index(Index& idx, const Address& key) {
        auto it = idx.find(key);
        if (it == idx.end()) return;
        if (!it->second.empty()) it->second.pop_back();
        if (it->second.empty()) idx.erase(it);
    }

    static const std::vector<OrderId>& lookup(const Index& idx, const Address& key) {
        static const std::vector<OrderId> kEmpty;
        auto it = idx.find(key);
        return it == idx.end() ? kEmpty : it->second;
    }

    std::vector<Order> orders_;
    Index owned_;
    Index bought_;
};

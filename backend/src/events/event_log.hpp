#pragma once
#include <cstddef>
#include <vector>

#include "core/events.hpp"
#include "core/pagination.hpp"

// Keeps every published event in memory, in publication order.
class MemoryEventLog final : public IEventSink {
public:
    void publish(const Event& ev) override { events_.push_back(ev); }

    const std::vector<Event>& events() const { return events_; }
    std::size_t size() const { return events_.size(); }
    Page<Event> page(std::size_t cursor, std::size_t how_many) const {
        return fetch_page(events_, cursor, how_many);
    }

private:
    std::vector<Event> events_;
};

// Forwards each event to every registered sink, in registration order. A
// throwing sink stops the fan-out, so register durable sinks before volatile ones.
class FanoutEventSink final : public IEventSink {
public:
    void add(IEventSink& sink) { sinks_.push_back(&sink); }

    void publish(const Event& ev) override {
        for (auto* s : sinks_) {
            s->publish(ev);
        }
    }

private:
    std::vector<IEventSink*> sinks_;
};

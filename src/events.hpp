#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T>: frame-scoped queue of one event type, stored as a World resource.
//
// The emitting system calls send(); any later system in the same frame may
// read(). Nothing survives the next EventRegistry::flush_all().
// ---------------------------------------------------------------------------

template<typename T>
class Events {
public:
    void send(T event) { pending_.push_back(std::move(event)); }

    const std::vector<T>& read() const { return pending_; }

    std::size_t size()  const { return pending_.size(); }
    bool        empty() const { return pending_.empty(); }
    void        clear()       { pending_.clear(); }

private:
    std::vector<T> pending_;
};

// ---------------------------------------------------------------------------
// EventRegistry: owns the list of queues to clear each frame (World resource).
//
// register_queue<T>() creates the Events<T> resource the first time it is
// called for T; later calls for the same T are ignored, so two modules may
// both declare a queue they share.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (!registered_.insert(std::type_index(typeid(T))).second) return;

        world.set_resource(Events<T>{});
        clear_fns_.push_back([&world]() {
            if (auto* queue = world.try_resource<Events<T>>()) queue->clear();
        });
    }

    // Empties every registered queue. First Pre-Update step of each frame.
    void flush_all() {
        for (auto& clear : clear_fns_) clear();
    }

    std::size_t queue_count() const { return clear_fns_.size(); }

private:
    std::unordered_set<std::type_index> registered_;
    std::vector<std::function<void()>>  clear_fns_;
};

// ---------------------------------------------------------------------------
// Controller events (emitted by CharacterControlSystem)
// ---------------------------------------------------------------------------

// The controller's basis name changed this frame. `from` is empty for the
// first basis a character receives.
struct BasisSwitchedEvent {
    ecs::Entity entity;
    std::string from;
    std::string to;
};

// A jump basis was entered this frame.
struct JumpEvent {
    ecs::Entity entity;
};

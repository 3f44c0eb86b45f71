#pragma once
#include "components.hpp"
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T>: typed, frame-scoped event queue
//
// Stored as a World resource. Systems emit via send() and consume via read().
// EventRegistry::flush_all() clears all queues at the start of each frame.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry: flush coordinator (stored as a World resource)
//
// Call register_queue<T>(world) once per event type during startup.
// Call flush_all() as the first Pre-Update step each frame.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

// Emitted by PlayerControllerSystem when a jump launches.
// impulse: launch velocity (m/s).
struct JumpEvent {
    ecs::Entity entity;
    float       impulse;
};

// Emitted on a view-mode transition, after the rigs were swapped.
struct ViewModeChangedEvent {
    ecs::Entity entity;
    ViewMode    mode;
};

// Animation events raised by GaitSystem. clip_weight is the blend weight of
// the clip that raised the event; AudioSystem ignores weak ones.
struct FootstepEvent {
    ecs::Entity entity;
    ecs::Vec3   position;
    float       clip_weight;
};

struct LandEvent {
    ecs::Entity entity;
    ecs::Vec3   position;
    float       clip_weight;
};

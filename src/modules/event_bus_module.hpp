#pragma once
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// EventBusModule
//
// Sets up the EventRegistry resource and clears every queue at the top of
// Pre-Update, so events emitted in one frame are readable until the next
// frame starts. Install first; modules register their own queues.
// ---------------------------------------------------------------------------

struct EventBusModule {
    static void install(ecs::World& world, tnua::Pipeline& pipeline) {
        world.set_resource(EventRegistry{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            if (auto* reg = w.try_resource<EventRegistry>()) reg->flush_all();
        });
    }
};

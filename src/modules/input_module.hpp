#pragma once
#include "../input_state.hpp"
#include "../pipeline.hpp"
#include "../systems/input_gather.hpp"
#include "../systems/player_input.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// InputModule
//
// Device sampling and the keyboard/gamepad -> PlayerInput mapping, both in
// Pre-Update after the event flush. The character stages see this frame's
// PlayerInput when they run.
// ---------------------------------------------------------------------------

struct InputModule {
    static void install(ecs::World& world, tnua::Pipeline& pipeline) {
        world.set_resource(InputRecord{});
        pipeline.add_pre_update([](ecs::World& w, float) {
            InputGatherSystem::Update(w);
            PlayerInputSystem::Update(w);
        });
    }
};

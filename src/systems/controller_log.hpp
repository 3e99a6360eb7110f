#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// ControllerLogSystem: Logic-phase system; consumes BasisSwitchedEvent and
// JumpEvent and reports them through TraceLog at LOG_DEBUG.
//
// No Register(): no lifecycle hooks. Runs after CharacterControlSystem
// (the emitter) in the same frame, before the queues are flushed.
// ---------------------------------------------------------------------------

class ControllerLogSystem {
public:
    static void Update(ecs::World& world, float dt);
};

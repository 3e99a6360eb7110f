#pragma once
#include <ecs/ecs.hpp>

// Applies tnua::Motor to Jolt: velocity change, facing, ExtendedUpdate, and
// transform sync back to ECS. Motors phase. Runs after BasisSystem and
// before the fixed Physics step. Zero-duration frames are skipped, matching
// the basis driver, so a boost is never applied twice.
class CharacterMotorSystem {
public:
    static void Update(ecs::World& world, float dt);
};

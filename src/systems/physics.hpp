#pragma once
#include <ecs/ecs.hpp>

// Creates Jolt bodies for RigidBodyConfig entities (the level geometry the
// characters walk on), steps the simulation at the fixed physics rate and
// syncs dynamic bodies back into the ECS transforms.
class PhysicsSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};

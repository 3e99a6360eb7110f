#pragma once
#include <ecs/ecs.hpp>

// Owns the Jolt CharacterVirtual of every controlled character and copies its
// state (position, velocity, ground contact, gravity) into
// tnua::RigidBodyTracker. Sensors phase, first of the character stages.
class CharacterSensorSystem {
public:
    static void Register(ecs::World& world);
    static void Update(ecs::World& world, float dt);
};

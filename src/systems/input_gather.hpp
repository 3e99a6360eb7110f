#pragma once
#include <ecs/ecs.hpp>

// Samples keyboard and gamepads into the InputRecord resource (created on
// first use). First Pre-Update step after the event flush.
class InputGatherSystem {
public:
    static void Update(ecs::World& world);
};

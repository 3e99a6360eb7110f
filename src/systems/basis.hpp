#pragma once
#include <ecs/ecs.hpp>
#include "../basis.hpp"
#include "../controller.hpp"

// ---------------------------------------------------------------------------
// BasisSystem: the basis driver. Logic phase.
//
// Must run after the Sensors stage has refreshed RigidBodyTracker and after
// User Controls have issued this frame's basis requests, and before the
// Motors stage reads Motor.
//
// Register() attaches an empty tnua::Controller (plus its tracker and motor)
// to every entity that gains a CharacterControllerConfig.
// ---------------------------------------------------------------------------

class BasisSystem {
public:
    static void Register(ecs::World& world);

    // Advances every controller's basis once. A zero-duration frame is
    // skipped entirely.
    static void Update(ecs::World& world, float dt);

    // Advances one controller. Returns false if the slot is empty.
    // Exposed for unit testing.
    static bool apply_controller(float frame_duration,
                                 const tnua::RigidBodyTracker& tracker,
                                 tnua::Controller& controller,
                                 tnua::Motor& motor);
};

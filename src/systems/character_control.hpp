#pragma once
#include <ecs/ecs.hpp>
#include "../basis.hpp"
#include "../components.hpp"
#include "../controller.hpp"

// Turns PlayerInput + ControlTuning into one basis request per character.
// Runs in the User Controls phase, after Sensors and before BasisSystem.
// Emits BasisSwitchedEvent / JumpEvent when those queues are registered.
class CharacterControlSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Pure decision step, no World access. Exposed for unit testing.
    //   rising jump + button held  -> "jump" (kept)
    //   press while grounded/coyote -> "jump" (new)
    //   grounded or within coyote   -> "walk"
    //   otherwise                   -> "fall"
    static void apply_controls(const PlayerInput& input,
                               const ControlTuning& tuning,
                               const tnua::RigidBodyTracker& tracker,
                               tnua::Controller& controller);

    // Move input projected onto the horizontal plane of the view directions.
    static ecs::Vec3 move_direction(const PlayerInput& input);
};

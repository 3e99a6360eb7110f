#pragma once
#include "../basis.hpp"

namespace tnua::builtin {

// Launches once to reach `height` above the take-off point, then arcs under
// gravity. Gravity is scaled by (1 + fall_extra_gravity) on the way down.
struct Jump {
    float     height             = 3.0f;
    ecs::Vec3 desired_velocity   = {0, 0, 0};
    ecs::Vec3 desired_forward    = {0, 0, 0};
    float     air_acceleration   = 5.0f;
    float     fall_extra_gravity = 0.6f;

    struct State {
        bool  launched = false;
        float elapsed  = 0.0f;
    };

    void apply(State& state, const BasisContext& ctx, Motor& motor) const;

    // Launch speed along `up` for the configured height under |gravity|.
    float launch_speed(const ecs::Vec3& gravity) const;

    static bool is_rising(const State& state, const RigidBodyTracker& tracker,
                          const ecs::Vec3& up = {0, 1, 0});
};

} // namespace tnua::builtin

#pragma once
#include "../basis.hpp"

namespace tnua::builtin {

// Airborne without a jump: limited air control plus (heavier) gravity.
struct FreeFall {
    ecs::Vec3 desired_velocity   = {0, 0, 0};
    ecs::Vec3 desired_forward    = {0, 0, 0};
    float     air_acceleration   = 5.0f;
    float     fall_extra_gravity = 0.6f;

    struct State {
        float fall_time = 0.0f;
    };

    void apply(State& state, const BasisContext& ctx, Motor& motor) const;
};

} // namespace tnua::builtin

#pragma once
#include "../basis.hpp"

namespace tnua::builtin {

// Ground locomotion. Also carries the character over a ledge for
// `coyote_time` seconds before reporting itself airborne, so the control
// system can still grant a jump in that window.
struct Walk {
    ecs::Vec3 desired_velocity = {0, 0, 0};
    ecs::Vec3 desired_forward  = {0, 0, 0};
    float     acceleration     = 15.0f; // fraction of the velocity gap closed per second
    float     air_acceleration = 5.0f;
    float     coyote_time      = 0.2f;

    struct State {
        float     airborne_timer   = 0.0f;
        float     standing_time    = 0.0f;
        ecs::Vec3 running_velocity = {0, 0, 0};
    };

    void apply(State& state, const BasisContext& ctx, Motor& motor) const;

    bool is_airborne(const State& state) const { return state.airborne_timer > coyote_time; }
};

} // namespace tnua::builtin

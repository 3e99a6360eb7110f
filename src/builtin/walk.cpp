#include "walk.hpp"
#include "../math_util.hpp"

namespace tnua::builtin {

using namespace tnua::math;

void Walk::apply(State& state, const BasisContext& ctx, Motor& motor) const {
    const float      dt        = ctx.frame_duration;
    const ecs::Vec3& up        = ctx.up_direction;
    const bool       on_ground = ctx.tracker.on_ground();

    if (on_ground) {
        state.airborne_timer = 0.0f;
        state.standing_time += dt;
    } else {
        state.airborne_timer += dt;
        state.standing_time   = 0.0f;
    }

    // --- Horizontal: close the gap to desired_velocity ---
    ecs::Vec3 horizontal = reject(ctx.tracker.velocity, up);
    ecs::Vec3 target     = reject(desired_velocity, up);
    float     rate       = on_ground ? acceleration : air_acceleration;

    ecs::Vec3 horizontal_accel = approach_acceleration(horizontal, target, rate, dt);
    state.running_velocity     = add(horizontal, scale(horizontal_accel, dt));

    motor.lin.acceleration = horizontal_accel;
    motor.lin.boost        = {0, 0, 0};

    // --- Vertical: stand still on ground, fall otherwise ---
    if (on_ground) {
        float vertical  = along(ctx.tracker.velocity, up);
        motor.lin.boost = scale(up, -vertical);
    } else {
        motor.lin.acceleration = add(motor.lin.acceleration, ctx.tracker.gravity);
    }

    motor.desired_forward = normalized_or_zero(reject(desired_forward, up));
}

} // namespace tnua::builtin

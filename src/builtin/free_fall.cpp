#include "free_fall.hpp"
#include "../math_util.hpp"

namespace tnua::builtin {

using namespace tnua::math;

void FreeFall::apply(State& state, const BasisContext& ctx, Motor& motor) const {
    const float      dt = ctx.frame_duration;
    const ecs::Vec3& up = ctx.up_direction;

    state.fall_time += dt;

    ecs::Vec3 horizontal = reject(ctx.tracker.velocity, up);
    ecs::Vec3 air_accel  = approach_acceleration(horizontal, reject(desired_velocity, up),
                                                 air_acceleration, dt);

    float gravity_scale = along(ctx.tracker.velocity, up) < 0.0f ? 1.0f + fall_extra_gravity : 1.0f;

    motor.lin.acceleration = add(air_accel, scale(ctx.tracker.gravity, gravity_scale));
    motor.lin.boost        = {0, 0, 0};
    motor.desired_forward  = normalized_or_zero(reject(desired_forward, up));
}

} // namespace tnua::builtin

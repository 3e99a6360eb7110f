#include "jump.hpp"
#include "../math_util.hpp"
#include <cmath>

namespace tnua::builtin {

using namespace tnua::math;

float Jump::launch_speed(const ecs::Vec3& gravity) const {
    return std::sqrt(2.0f * length(gravity) * std::max(height, 0.0f));
}

bool Jump::is_rising(const State& state, const RigidBodyTracker& tracker, const ecs::Vec3& up) {
    // Before launch the jump counts as rising so a held button keeps it alive.
    return !state.launched || along(tracker.velocity, up) > 0.0f;
}

void Jump::apply(State& state, const BasisContext& ctx, Motor& motor) const {
    const float      dt = ctx.frame_duration;
    const ecs::Vec3& up = ctx.up_direction;

    ecs::Vec3 horizontal = reject(ctx.tracker.velocity, up);
    motor.lin.acceleration = approach_acceleration(horizontal, reject(desired_velocity, up),
                                                   air_acceleration, dt);
    motor.lin.boost        = {0, 0, 0};
    motor.desired_forward  = normalized_or_zero(reject(desired_forward, up));

    if (!state.launched) {
        float vertical  = along(ctx.tracker.velocity, up);
        motor.lin.boost = scale(up, launch_speed(ctx.tracker.gravity) - vertical);
        state.launched  = true;
        state.elapsed   = 0.0f;
        return;
    }

    state.elapsed += dt;

    float gravity_scale = along(ctx.tracker.velocity, up) < 0.0f ? 1.0f + fall_extra_gravity : 1.0f;
    motor.lin.acceleration = add(motor.lin.acceleration, scale(ctx.tracker.gravity, gravity_scale));
}

} // namespace tnua::builtin

#include "character_control.hpp"
#include "../builtin/free_fall.hpp"
#include "../builtin/jump.hpp"
#include "../builtin/walk.hpp"
#include "../events.hpp"
#include "../math_util.hpp"
#include <string>

using namespace ecs;
using namespace tnua::math;
using tnua::builtin::FreeFall;
using tnua::builtin::Jump;
using tnua::builtin::Walk;

ecs::Vec3 CharacterControlSystem::move_direction(const PlayerInput& input) {
    const ecs::Vec3 up = {0, 1, 0};

    ecs::Vec3 fwd   = normalized_or_zero(reject(input.view_forward, up));
    ecs::Vec3 right = normalized_or_zero(reject(input.view_right, up));
    if (length_sq(fwd) == 0.0f) fwd = {0, 0, 1};
    if (length_sq(right) == 0.0f) right = {-fwd.z, 0, fwd.x};

    ecs::Vec3 move = add(scale(fwd, input.move_input.y), scale(right, input.move_input.x));
    if (length_sq(move) > 1.0f) move = normalized_or_zero(move);
    return move;
}

void CharacterControlSystem::apply_controls(const PlayerInput& input,
                                            const ControlTuning& tuning,
                                            const tnua::RigidBodyTracker& tracker,
                                            tnua::Controller& controller) {
    const ecs::Vec3 move    = move_direction(input);
    const ecs::Vec3 desired = scale(move, tuning.walk_speed);

    const bool grounded = tracker.on_ground();

    bool coyote = false;
    if (const auto* walk = controller.concrete_basis<Walk>()) {
        coyote = !walk->is_airborne(*controller.basis_state<Walk>());
    }
    const Jump::State* jump_state = controller.basis_state<Jump>();

    Jump jump;
    jump.height             = tuning.jump_height;
    jump.desired_velocity   = desired;
    jump.desired_forward    = move;
    jump.air_acceleration   = tuning.air_acceleration;
    jump.fall_extra_gravity = tuning.fall_extra_gravity;

    if (jump_state && input.jump_held && Jump::is_rising(*jump_state, tracker)) {
        controller.basis("jump", jump);
        return;
    }

    if (!jump_state && input.jump_pressed && (grounded || coyote)) {
        controller.basis("jump", jump);
        return;
    }

    if (grounded || coyote) {
        Walk walk;
        walk.desired_velocity = desired;
        walk.desired_forward  = move;
        walk.acceleration     = tuning.acceleration;
        walk.air_acceleration = tuning.air_acceleration;
        walk.coyote_time      = tuning.coyote_time;
        controller.basis("walk", walk);
        return;
    }

    FreeFall fall;
    fall.desired_velocity   = desired;
    fall.desired_forward    = move;
    fall.air_acceleration   = tuning.air_acceleration;
    fall.fall_extra_gravity = tuning.fall_extra_gravity;
    controller.basis("fall", fall);
}

void CharacterControlSystem::Update(World& world, float /*dt*/) {
    auto* switched = world.try_resource<Events<BasisSwitchedEvent>>();
    auto* jumps    = world.try_resource<Events<JumpEvent>>();

    world.each<PlayerTag, PlayerInput, ControlTuning, tnua::RigidBodyTracker, tnua::Controller>(
        [&](Entity e, PlayerTag&, PlayerInput& input, ControlTuning& tuning,
            tnua::RigidBodyTracker& tracker, tnua::Controller& controller) {
            const std::string previous = controller.basis_name();

            apply_controls(input, tuning, tracker, controller);

            if (controller.basis_name() == previous) return;
            if (switched) switched->send({e, previous, controller.basis_name()});
            if (jumps && controller.basis_name() == "jump") jumps->send({e});
        });
}

#pragma once
#include "../basis.hpp"
#include "../builtin/walk.hpp"
#include "../components.hpp"
#include "../controller.hpp"
#include "../debug_panel.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include "../systems/basis.hpp"
#include "../systems/character_control.hpp"
#include "../systems/character_motor.hpp"
#include "../systems/character_sensor.hpp"
#include "../systems/controller_log.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// CharacterModule
//
// Registers the lifecycle hooks that give every CharacterControllerConfig
// entity a Jolt character and an empty tnua::Controller, registers the event
// queues CharacterControlSystem emits, wires the four character stages, and
// adds "Controller" watch rows plus "Tuning" tunables to the DebugPanel.
//
// Stage placement:
//   sensors        → CharacterSensor
//   user_controls  → CharacterControl
//   logic          → Basis (driver), ControllerLog
//   motors         → CharacterMotor
//
// Requires PhysicsModule (for the Jolt hook) and EventBusModule to be
// installed first; DebugModule first if the debug rows are wanted.
// ---------------------------------------------------------------------------

namespace detail {

// Runs fn on the player's components of type T, if there is a player.
template<typename T, typename Fn>
inline void with_player(ecs::World& world, Fn&& fn) {
    world.single<PlayerTag, T>([&](ecs::Entity, PlayerTag&, T& c) { fn(c); });
}

inline void tune_field(DebugPanel& panel, ecs::World& world, const char* label,
                       float ControlTuning::*field, float min, float max, float step) {
    panel.tune("Tuning", label,
        [&world, field]() {
            float v = 0.0f;
            with_player<ControlTuning>(world, [&](ControlTuning& t) { v = t.*field; });
            return v;
        },
        [&world, field](float v) {
            with_player<ControlTuning>(world, [&](ControlTuning& t) { t.*field = v; });
        },
        min, max, step);
}

inline const char* ground_label(tnua::GroundState s) {
    switch (s) {
        case tnua::GroundState::OnGround:      return "OnGround";
        case tnua::GroundState::OnSteepGround: return "OnSteepGround";
        case tnua::GroundState::NotSupported:  return "NotSupported";
        case tnua::GroundState::InAir:         break;
    }
    return "InAir";
}

} // namespace detail

struct CharacterModule {
    static void install(ecs::World& world, tnua::Pipeline& pipeline) {
        // Lifecycle hooks
        BasisSystem::Register(world);
        CharacterSensorSystem::Register(world);

        // Event queues owned by CharacterControlSystem (it is the emitter)
        world.resource<EventRegistry>().register_queue<BasisSwitchedEvent>(world);
        world.resource<EventRegistry>().register_queue<JumpEvent>(world);

        pipeline.add_sensors(      [](ecs::World& w, float dt) { CharacterSensorSystem::Update(w, dt); });
        pipeline.add_user_controls([](ecs::World& w, float dt) { CharacterControlSystem::Update(w, dt); });
        pipeline.add_logic(        [](ecs::World& w, float dt) { BasisSystem::Update(w, dt); });
        pipeline.add_logic(        [](ecs::World& w, float dt) { ControllerLogSystem::Update(w, dt); });
        pipeline.add_motors(       [](ecs::World& w, float dt) { CharacterMotorSystem::Update(w, dt); });

        auto* panel = world.try_resource<DebugPanel>();
        if (!panel) return;

        panel->watch("Controller", "Basis", [&world]() {
            std::string r = "-";
            detail::with_player<tnua::Controller>(world, [&](tnua::Controller& c) {
                if (c.has_basis()) r = c.basis_name();
            });
            return r;
        });
        panel->watch("Controller", "Ground", [&world]() {
            std::string r = "-";
            detail::with_player<tnua::RigidBodyTracker>(world, [&](tnua::RigidBodyTracker& t) {
                r = detail::ground_label(t.ground);
            });
            return r;
        });
        panel->watch("Controller", "Airborne", [&world]() {
            std::string r = "-";
            detail::with_player<tnua::Controller>(world, [&](tnua::Controller& c) {
                if (const auto* s = c.basis_state<tnua::builtin::Walk>()) {
                    char b[16];
                    std::snprintf(b, sizeof(b), "%.2f s", s->airborne_timer);
                    r = b;
                }
            });
            return r;
        });
        panel->watch("Controller", "Velocity", [&world]() {
            std::string r = "-";
            detail::with_player<tnua::RigidBodyTracker>(world, [&](tnua::RigidBodyTracker& t) {
                char b[48];
                std::snprintf(b, sizeof(b), "%.1f %.1f %.1f", t.velocity.x, t.velocity.y, t.velocity.z);
                r = b;
            });
            return r;
        });

        detail::tune_field(*panel, world, "Walk Speed",    &ControlTuning::walk_speed,         0.0f, 30.0f, 0.5f);
        detail::tune_field(*panel, world, "Acceleration",  &ControlTuning::acceleration,       0.0f, 60.0f, 1.0f);
        detail::tune_field(*panel, world, "Air Accel",     &ControlTuning::air_acceleration,   0.0f, 60.0f, 1.0f);
        detail::tune_field(*panel, world, "Coyote Time",   &ControlTuning::coyote_time,        0.0f, 1.0f,  0.05f);
        detail::tune_field(*panel, world, "Jump Height",   &ControlTuning::jump_height,        0.0f, 10.0f, 0.25f);
        detail::tune_field(*panel, world, "Fall Gravity+", &ControlTuning::fall_extra_gravity, 0.0f, 5.0f,  0.1f);
    }
};

#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// Plain data components. No Jolt or Raylib headers here so the headless
// core and test targets can include this file.
// Controller state itself lives in controller.hpp / basis.hpp.
// ---------------------------------------------------------------------------

// ---------------------------------------------------------------------------
// Physics Configuration (Authoring)
// ---------------------------------------------------------------------------

enum class BodyType { Static, Kinematic, Dynamic };

struct BoxCollider {
    ecs::Vec3 half_extents = {0.5f, 0.5f, 0.5f};
};

struct SphereCollider {
    float radius = 0.5f;
};

// If present, the PhysicsSystem will try to create a Jolt Body for this entity
struct RigidBodyConfig {
    BodyType type = BodyType::Dynamic;
    float mass = 1.0f;
    float friction = 0.5f;
    float restitution = 0.0f;
    bool sensor = false;
};

// If present, the character gets a Jolt CharacterVirtual and a tnua::Controller
struct CharacterControllerConfig {
    float height = 1.8f;
    float radius = 0.4f;
    float mass = 70.0f;
    float max_slope_angle = 45.0f; // degrees
};

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

enum class ShapeType { Box, Sphere, Capsule };

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

namespace Colors {
    inline constexpr Color4 White  = {1.0f, 1.0f, 1.0f, 1.0f};
    inline constexpr Color4 Maroon = {0.75f, 0.13f, 0.22f, 1.0f};
}

struct MeshRenderer {
    ShapeType shape_type = ShapeType::Box;
    Color4 color = Colors::White;
    ecs::Vec3 scale_offset = {1, 1, 1}; // Visual scale multiplier
};

// ---------------------------------------------------------------------------
// Gameplay / Input
// ---------------------------------------------------------------------------

struct PlayerInput {
    ecs::Vec2 move_input = {0, 0}; // X, Y (WASD / Left Stick)
    bool jump_pressed = false;     // rising edge this frame
    bool jump_held = false;
    ecs::Vec3 view_forward = {0, 0, 1};
    ecs::Vec3 view_right = {-1, 0, 0};
};

// Per-character tuning fed into the basis configurations every frame.
// Loaded from the scene's "controller" block; editable at runtime.
struct ControlTuning {
    float walk_speed = 10.0f;
    float acceleration = 15.0f;
    float air_acceleration = 5.0f;
    float coyote_time = 0.2f;
    float jump_height = 3.0f;
    float fall_extra_gravity = 0.6f;
};

struct PlayerTag {};
struct WorldTag {};

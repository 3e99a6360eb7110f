#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "../src/basis.hpp"
#include "../src/controller.hpp"
#include "../src/components.hpp"
#include "../src/builtin/free_fall.hpp"
#include "../src/builtin/jump.hpp"
#include "../src/builtin/walk.hpp"
#include "../src/systems/basis.hpp"
#include <ecs/ecs.hpp>
#include <cmath>

// Controller, BasisSystem and the built-in bases are headless: none of these
// tests link Jolt or Raylib.

using Catch::Matchers::WithinAbs;
using tnua::builtin::FreeFall;
using tnua::builtin::Jump;
using tnua::builtin::Walk;

// ---------------------------------------------------------------------------
// Counting bases: record how often and for how long they were advanced.
// ---------------------------------------------------------------------------

struct Stride {
    float speed = 0.0f;

    struct State {
        int   advances = 0;
        float timer    = 0.0f;
    };

    void apply(State& state, const tnua::BasisContext& ctx, tnua::Motor& motor) const {
        ++state.advances;
        state.timer += ctx.frame_duration;
        motor.lin.acceleration = {speed, 0, 0};
    }
};

struct Drop {
    struct State {
        int advances = 0;
    };

    void apply(State& state, const tnua::BasisContext&, tnua::Motor& motor) const {
        ++state.advances;
        motor.lin.acceleration = {0, -1, 0};
    }
};

static int stride_advances(const tnua::Controller& c) {
    const auto* s = c.basis_state<Stride>();
    return s ? s->advances : -1;
}

// ---------------------------------------------------------------------------
// Controller slot
// ---------------------------------------------------------------------------

TEST_CASE("Controller — starts empty", "[controller]") {
    tnua::Controller c;

    CHECK_FALSE(c.has_basis());
    CHECK(c.basis_name().empty());
    CHECK(c.dynamic_basis() == nullptr);
    CHECK(c.concrete_basis<Stride>() == nullptr);
    CHECK(c.basis_state<Stride>() == nullptr);
}

TEST_CASE("Controller — first request installs basis with default state", "[controller]") {
    tnua::Controller c;
    c.basis("walk", Stride{5.0f});

    REQUIRE(c.has_basis());
    CHECK(c.basis_name() == "walk");
    REQUIRE(c.concrete_basis<Stride>() != nullptr);
    CHECK(c.concrete_basis<Stride>()->speed == 5.0f);
    CHECK(c.basis_state<Stride>()->advances == 0);
    CHECK(c.concrete_basis<Drop>() == nullptr);
}

TEST_CASE("Controller — same type updates config in place and keeps state", "[controller]") {
    tnua::Controller c;
    tnua::RigidBodyTracker tracker;
    tnua::Motor motor;

    c.basis("walk", Stride{5.0f});
    const tnua::DynamicBasis* before = c.dynamic_basis();
    BasisSystem::apply_controller(0.5f, tracker, c, motor);

    c.basis("stroll", Stride{7.0f});

    CHECK(c.dynamic_basis() == before);
    CHECK(c.basis_name() == "stroll");
    CHECK(c.concrete_basis<Stride>()->speed == 7.0f);
    CHECK(c.basis_state<Stride>()->advances == 1);
    CHECK_THAT(c.basis_state<Stride>()->timer, WithinAbs(0.5f, 1e-6f));
}

TEST_CASE("Controller — different type replaces basis and resets state", "[controller]") {
    tnua::Controller c;
    tnua::RigidBodyTracker tracker;
    tnua::Motor motor;

    c.basis("walk", Stride{5.0f});
    BasisSystem::apply_controller(0.016f, tracker, c, motor);
    BasisSystem::apply_controller(0.016f, tracker, c, motor);

    c.basis("fall", Drop{});

    CHECK(c.basis_name() == "fall");
    CHECK(c.concrete_basis<Stride>() == nullptr);
    REQUIRE(c.basis_state<Drop>() != nullptr);
    CHECK(c.basis_state<Drop>()->advances == 0);

    // Switching back starts a fresh Stride as well
    c.basis("walk", Stride{5.0f});
    CHECK(stride_advances(c) == 0);
}

TEST_CASE("Controller — request returns the controller for chaining", "[controller]") {
    tnua::Controller c;
    CHECK(&c.basis("walk", Stride{}) == &c);
}

// ---------------------------------------------------------------------------
// BasisSystem (driver)
// ---------------------------------------------------------------------------

TEST_CASE("BasisSystem — apply_controller on empty slot does nothing", "[basis_system]") {
    tnua::Controller c;
    tnua::RigidBodyTracker tracker;
    tnua::Motor motor;
    motor.lin.acceleration = {1, 2, 3};

    CHECK_FALSE(BasisSystem::apply_controller(0.016f, tracker, c, motor));
    CHECK(motor.lin.acceleration.x == 1.0f);
    CHECK(motor.lin.acceleration.y == 2.0f);
    CHECK(motor.lin.acceleration.z == 3.0f);
}

TEST_CASE("BasisSystem — Register gives characters an empty controller", "[basis_system]") {
    ecs::World world;
    BasisSystem::Register(world);

    auto e = world.create();
    world.add(e, CharacterControllerConfig{});

    CHECK(world.has<tnua::Controller>(e));
    CHECK(world.has<tnua::RigidBodyTracker>(e));
    CHECK(world.has<tnua::Motor>(e));
    CHECK_FALSE(world.try_get<tnua::Controller>(e)->has_basis());
}

TEST_CASE("BasisSystem — advances once per controller with a basis", "[basis_system]") {
    ecs::World world;
    BasisSystem::Register(world);

    auto a = world.create();
    auto b = world.create();
    auto idle = world.create();
    world.add(a, CharacterControllerConfig{});
    world.add(b, CharacterControllerConfig{});
    world.add(idle, CharacterControllerConfig{});

    world.try_get<tnua::Controller>(a)->basis("walk", Stride{1.0f});
    world.try_get<tnua::Controller>(b)->basis("walk", Stride{2.0f});

    BasisSystem::Update(world, 0.016f);

    CHECK(stride_advances(*world.try_get<tnua::Controller>(a)) == 1);
    CHECK(stride_advances(*world.try_get<tnua::Controller>(b)) == 1);
    CHECK_FALSE(world.try_get<tnua::Controller>(idle)->has_basis());

    // Each basis wrote its own motor
    CHECK(world.try_get<tnua::Motor>(a)->lin.acceleration.x == 1.0f);
    CHECK(world.try_get<tnua::Motor>(b)->lin.acceleration.x == 2.0f);
    CHECK(world.try_get<tnua::Motor>(idle)->lin.acceleration.x == 0.0f);
}

TEST_CASE("BasisSystem — zero-duration frame advances nothing", "[basis_system]") {
    ecs::World world;
    BasisSystem::Register(world);

    for (int i = 0; i < 4; ++i) {
        auto e = world.create();
        world.add(e, CharacterControllerConfig{});
        world.try_get<tnua::Controller>(e)->basis("walk", Stride{1.0f});
    }

    BasisSystem::Update(world, 0.0f);

    int advanced = 0;
    world.each<tnua::Controller>([&](ecs::Entity, tnua::Controller& c) {
        advanced += stride_advances(c);
    });
    CHECK(advanced == 0);
}

TEST_CASE("BasisSystem — walk, walk, paused tick", "[basis_system]") {
    ecs::World world;
    BasisSystem::Register(world);
    auto e = world.create();
    world.add(e, CharacterControllerConfig{});

    // Tick 1: first request, one advance
    world.try_get<tnua::Controller>(e)->basis("walk", Stride{5.0f});
    BasisSystem::Update(world, 0.016f);
    {
        auto& c = *world.try_get<tnua::Controller>(e);
        CHECK(c.basis_name() == "walk");
        CHECK(stride_advances(c) == 1);
    }
    const tnua::DynamicBasis* instance = world.try_get<tnua::Controller>(e)->dynamic_basis();

    // Tick 2: same type, new speed; state carries over
    world.try_get<tnua::Controller>(e)->basis("walk", Stride{7.0f});
    BasisSystem::Update(world, 0.016f);
    {
        auto& c = *world.try_get<tnua::Controller>(e);
        CHECK(c.dynamic_basis() == instance);
        CHECK(c.concrete_basis<Stride>()->speed == 7.0f);
        CHECK(stride_advances(c) == 2);
        CHECK_THAT(c.basis_state<Stride>()->timer, WithinAbs(0.032f, 1e-6f));
    }

    // Tick 3: request still lands, advance is skipped
    world.try_get<tnua::Controller>(e)->basis("walk", Stride{7.0f});
    BasisSystem::Update(world, 0.0f);
    {
        auto& c = *world.try_get<tnua::Controller>(e);
        CHECK(c.concrete_basis<Stride>()->speed == 7.0f);
        CHECK(stride_advances(c) == 2);
    }
}

TEST_CASE("BasisSystem — switching type runs only the new basis", "[basis_system]") {
    ecs::World world;
    BasisSystem::Register(world);
    auto e = world.create();
    world.add(e, CharacterControllerConfig{});

    world.try_get<tnua::Controller>(e)->basis("walk", Stride{5.0f});
    BasisSystem::Update(world, 0.016f);

    world.try_get<tnua::Controller>(e)->basis("fall", Drop{});
    BasisSystem::Update(world, 0.016f);
    BasisSystem::Update(world, 0.016f);

    auto& c = *world.try_get<tnua::Controller>(e);
    CHECK(c.basis_name() == "fall");
    CHECK(c.basis_state<Stride>() == nullptr);
    CHECK(c.basis_state<Drop>()->advances == 2);
    CHECK(world.try_get<tnua::Motor>(e)->lin.acceleration.y == -1.0f);
}

// ---------------------------------------------------------------------------
// Built-in bases
// ---------------------------------------------------------------------------

static tnua::RigidBodyTracker grounded_tracker() {
    tnua::RigidBodyTracker t;
    t.ground = tnua::GroundState::OnGround;
    return t;
}

TEST_CASE("Walk — closes a fraction of the velocity gap per frame", "[builtin]") {
    Walk walk;
    walk.desired_velocity = {10, 0, 0};
    walk.acceleration     = 15.0f;

    Walk::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();
    const float dt = 1.0f / 60.0f;

    walk.apply(state, {dt, tracker}, motor);

    // 15/s * 1/60 s = a quarter of the 10 m/s gap
    CHECK_THAT(motor.lin.acceleration.x * dt, WithinAbs(2.5f, 1e-4f));
    CHECK_THAT(state.running_velocity.x, WithinAbs(2.5f, 1e-4f));
}

TEST_CASE("Walk — never overshoots the desired velocity", "[builtin]") {
    Walk walk;
    walk.desired_velocity = {4, 0, -3};
    walk.acceleration     = 100.0f;

    Walk::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();
    const float dt = 0.1f;

    walk.apply(state, {dt, tracker}, motor);

    CHECK_THAT(tracker.velocity.x + motor.lin.acceleration.x * dt, WithinAbs(4.0f, 1e-4f));
    CHECK_THAT(tracker.velocity.z + motor.lin.acceleration.z * dt, WithinAbs(-3.0f, 1e-4f));
}

TEST_CASE("Walk — cancels vertical velocity on the ground", "[builtin]") {
    Walk walk;
    Walk::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();
    tracker.velocity = {0, -3, 0};

    walk.apply(state, {0.016f, tracker}, motor);

    CHECK_THAT(motor.lin.boost.y, WithinAbs(3.0f, 1e-5f));
    CHECK(motor.lin.acceleration.y == 0.0f);
    CHECK(state.airborne_timer == 0.0f);
    CHECK_THAT(state.standing_time, WithinAbs(0.016f, 1e-6f));
}

TEST_CASE("Walk — coyote window before reporting airborne", "[builtin]") {
    Walk walk;
    walk.coyote_time = 0.2f;
    Walk::State state;
    tnua::Motor motor;
    tnua::RigidBodyTracker tracker; // InAir

    walk.apply(state, {0.15f, tracker}, motor);
    CHECK_FALSE(walk.is_airborne(state));
    CHECK_THAT(motor.lin.acceleration.y, WithinAbs(-9.81f, 1e-4f));

    walk.apply(state, {0.15f, tracker}, motor);
    CHECK(walk.is_airborne(state));

    // Landing resets the window
    auto ground = grounded_tracker();
    walk.apply(state, {0.016f, ground}, motor);
    CHECK_FALSE(walk.is_airborne(state));
}

TEST_CASE("Walk — facing follows desired_forward on the horizontal plane", "[builtin]") {
    Walk walk;
    walk.desired_forward = {0, 5, 2};
    Walk::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();

    walk.apply(state, {0.016f, tracker}, motor);

    CHECK(motor.desired_forward.y == 0.0f);
    CHECK_THAT(motor.desired_forward.z, WithinAbs(1.0f, 1e-5f));
}

TEST_CASE("Jump — launches exactly once", "[builtin]") {
    Jump jump;
    jump.height = 3.0f;
    Jump::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();

    CHECK(Jump::is_rising(state, tracker));

    jump.apply(state, {0.016f, tracker}, motor);

    const float expected = std::sqrt(2.0f * 9.81f * 3.0f);
    CHECK(state.launched);
    CHECK_THAT(motor.lin.boost.y, WithinAbs(expected, 1e-3f));
    CHECK(motor.lin.acceleration.y == 0.0f);

    // Next frame: rising under plain gravity, no second boost
    tracker.ground   = tnua::GroundState::InAir;
    tracker.velocity = {0, 5, 0};
    jump.apply(state, {0.016f, tracker}, motor);

    CHECK(motor.lin.boost.y == 0.0f);
    CHECK_THAT(motor.lin.acceleration.y, WithinAbs(-9.81f, 1e-4f));
    CHECK_THAT(state.elapsed, WithinAbs(0.016f, 1e-6f));
    CHECK(Jump::is_rising(state, tracker));
}

TEST_CASE("Jump — launch compensates existing vertical velocity", "[builtin]") {
    Jump jump;
    jump.height = 3.0f;
    Jump::State state;
    tnua::Motor motor;
    auto tracker = grounded_tracker();
    tracker.velocity = {0, -2, 0};

    jump.apply(state, {0.016f, tracker}, motor);

    CHECK_THAT(motor.lin.boost.y, WithinAbs(std::sqrt(2.0f * 9.81f * 3.0f) + 2.0f, 1e-3f));
}

TEST_CASE("Jump — heavier gravity on the way down", "[builtin]") {
    Jump jump;
    jump.fall_extra_gravity = 0.5f;
    Jump::State state;
    state.launched = true;
    tnua::Motor motor;
    tnua::RigidBodyTracker tracker;
    tracker.velocity = {0, -1, 0};

    jump.apply(state, {0.016f, tracker}, motor);

    CHECK_THAT(motor.lin.acceleration.y, WithinAbs(-9.81f * 1.5f, 1e-4f));
    CHECK_FALSE(Jump::is_rising(state, tracker));
}

TEST_CASE("FreeFall — gravity plus air control", "[builtin]") {
    FreeFall fall;
    fall.desired_velocity   = {2, 0, 0};
    fall.air_acceleration   = 5.0f;
    fall.fall_extra_gravity = 0.6f;
    FreeFall::State state;
    tnua::Motor motor;
    motor.lin.boost = {0, 9, 0}; // stale
    tnua::RigidBodyTracker tracker;
    tracker.velocity = {0, -2, 0};

    fall.apply(state, {0.1f, tracker}, motor);

    CHECK(motor.lin.boost.y == 0.0f);
    CHECK_THAT(motor.lin.acceleration.y, WithinAbs(-9.81f * 1.6f, 1e-4f));
    // Half the 2 m/s gap per 0.1 s frame at 5/s
    CHECK_THAT(motor.lin.acceleration.x * 0.1f, WithinAbs(1.0f, 1e-4f));
    CHECK_THAT(state.fall_time, WithinAbs(0.1f, 1e-6f));
}

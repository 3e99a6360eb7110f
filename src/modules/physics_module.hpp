#pragma once
#include "../physics_context.hpp"
#include "../pipeline.hpp"
#include "../systems/physics.hpp"
#include <ecs/ecs.hpp>
#include <ecs/modules/transform_propagation.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// PhysicsModule
//
// Brings up Jolt (allocator, PhysicsContext resource), hooks RigidBodyConfig
// so level geometry gets bodies, and runs the simulation plus transform
// propagation at the fixed physics rate.
//
// CharacterModule depends on this: its sensor hook builds the Jolt character
// from the PhysicsContext, so install this one first.
// ---------------------------------------------------------------------------

struct PhysicsModule {
    static void install(ecs::World& world, tnua::Pipeline& pipeline) {
        PhysicsContext::InitJoltAllocator();
        world.set_resource(std::make_shared<PhysicsContext>());
        PhysicsSystem::Register(world);

        pipeline.add_physics([](ecs::World& w, float fixed_dt) {
            PhysicsSystem::Update(w, fixed_dt);
            ecs::propagate_transforms(w);
        });
    }
};

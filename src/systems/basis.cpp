#include "basis.hpp"
#include "../components.hpp"

using namespace ecs;

void BasisSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig&) {
            if (!w.has<tnua::Controller>(e))       w.add(e, tnua::Controller{});
            if (!w.has<tnua::RigidBodyTracker>(e)) w.add(e, tnua::RigidBodyTracker{});
            if (!w.has<tnua::Motor>(e))            w.add(e, tnua::Motor{});
        });
}

bool BasisSystem::apply_controller(float frame_duration,
                                   const tnua::RigidBodyTracker& tracker,
                                   tnua::Controller& controller,
                                   tnua::Motor& motor) {
    tnua::DynamicBasis* basis = controller.dynamic_basis();
    if (!basis) return false;

    tnua::BasisContext ctx{frame_duration, tracker};
    basis->apply(ctx, motor);
    return true;
}

void BasisSystem::Update(World& world, float dt) {
    // Paused or duplicate frame: no basis timers may advance.
    if (dt == 0.0f) return;

    world.each<tnua::Controller, tnua::RigidBodyTracker, tnua::Motor>(
        [dt](Entity, tnua::Controller& controller, tnua::RigidBodyTracker& tracker,
             tnua::Motor& motor) {
            apply_controller(dt, tracker, controller, motor);
        });
}

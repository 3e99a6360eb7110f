#include "character_sensor.hpp"
#include "../basis.hpp"
#include "../components.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <ecs/modules/transform.hpp>

using namespace ecs;

void CharacterSensorSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>(
        [](World& w, Entity e, CharacterControllerConfig& cfg) {
            auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
            if (!ctx_ptr || !*ctx_ptr) return;
            auto& ctx = **ctx_ptr;

            // Capsule standing on the entity origin
            JPH::RefConst<JPH::ShapeSettings> shape_settings =
                new JPH::RotatedTranslatedShapeSettings(
                    JPH::Vec3(0, 0.5f * cfg.height, 0), JPH::Quat::sIdentity(),
                    new JPH::CapsuleShapeSettings(0.5f * cfg.height - cfg.radius, cfg.radius));

            auto shape_result = shape_settings->Create();
            if (shape_result.HasError()) {
                TraceLog(LOG_WARNING, "CONTROLLER: character shape rejected: %s",
                         shape_result.GetError().c_str());
                return;
            }

            JPH::RVec3 pos = JPH::RVec3::sZero();
            if (auto* lt = w.try_get<LocalTransform>(e)) {
                pos = MathBridge::ToJolt(lt->position);
            }

            JPH::CharacterVirtualSettings settings;
            settings.mMass             = cfg.mass;
            settings.mMaxSlopeAngle    = JPH::DegreesToRadians(cfg.max_slope_angle);
            settings.mShape            = shape_result.Get();
            settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -cfg.radius);

            auto character = std::make_shared<JPH::CharacterVirtual>(
                &settings, pos, JPH::Quat::sIdentity(), ctx.physics_system);

            w.add(e, CharacterHandle{character});
        });
}

void CharacterSensorSystem::Update(World& world, float /*dt*/) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    const JPH::Vec3 gravity = (*ctx_ptr)->GetGravity();

    world.each<CharacterHandle, tnua::RigidBodyTracker>(
        [&](Entity, CharacterHandle& h, tnua::RigidBodyTracker& tracker) {
            auto* ch = h.character.get();
            tracker.translation   = MathBridge::FromJolt(ch->GetPosition());
            tracker.velocity      = MathBridge::FromJolt(ch->GetLinearVelocity());
            tracker.gravity       = MathBridge::FromJolt(gravity);
            tracker.ground        = MathBridge::FromJolt(ch->GetGroundState());
            tracker.ground_normal = MathBridge::FromJolt(ch->GetGroundNormal());
        });
}

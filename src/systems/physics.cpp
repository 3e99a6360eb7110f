#include "physics.hpp"
#include "../components.hpp"
#include "../physics_handles.hpp"
#include "../physics_context.hpp"
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <memory>

using namespace ecs;

static JPH::RefConst<JPH::Shape> make_shape(World& w, Entity e) {
    if (auto* box = w.try_get<BoxCollider>(e)) {
        return new JPH::BoxShape(MathBridge::ToJolt(box->half_extents));
    }
    if (auto* sphere = w.try_get<SphereCollider>(e)) {
        return new JPH::SphereShape(sphere->radius);
    }
    return new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
}

static JPH::EMotionType to_motion_type(BodyType type) {
    switch (type) {
        case BodyType::Static:    return JPH::EMotionType::Static;
        case BodyType::Kinematic: return JPH::EMotionType::Kinematic;
        case BodyType::Dynamic:   break;
    }
    return JPH::EMotionType::Dynamic;
}

void PhysicsSystem::Register(World& world) {
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;

        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();

        JPH::Vec3 pos = JPH::Vec3::sZero();
        JPH::Quat rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        }

        JPH::ObjectLayer layer = (cfg.type == BodyType::Static) ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(make_shape(w, e), pos, rot, to_motion_type(cfg.type), layer);
        settings.mRestitution = cfg.restitution;
        settings.mFriction    = cfg.friction;
        settings.mIsSensor    = cfg.sensor;
        if (cfg.type == BodyType::Dynamic) {
            settings.mOverrideMassProperties = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
        }

        JPH::Body* body = bi.CreateBody(settings);
        if (!body) {
            TraceLog(LOG_WARNING, "PHYSICS: body limit reached, entity has no collision");
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);

        w.add(e, RigidBodyHandle{body->GetID()});
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
        if (!ctx_ptr || !*ctx_ptr) return;
        JPH::BodyInterface& bi = (*ctx_ptr)->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    ctx.physics_system->Update(dt, 1, ctx.temp_allocator, ctx.job_system);

    // Static/kinematic bodies are driven by the ECS; only dynamic ones sync back.
    JPH::BodyInterface& bi = ctx.GetBodyInterface();
    world.each<RigidBodyHandle, WorldTransform, RigidBodyConfig>(
        [&](Entity e, RigidBodyHandle& h, WorldTransform& wt, RigidBodyConfig& cfg) {
            if (cfg.type != BodyType::Dynamic) return;

            JPH::RVec3 pos;
            JPH::Quat rot;
            bi.GetPositionAndRotation(h.id, pos, rot);

            ecs::Vec3 scale = {1, 1, 1};
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(pos);
                lt->rotation = MathBridge::FromJolt(rot);
                scale = lt->scale;
            }
            wt.matrix = mat4_compose(MathBridge::FromJolt(pos), MathBridge::FromJolt(rot), scale);
        });
}

#include "character_motor.hpp"
#include "../basis.hpp"
#include "../components.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <algorithm>
#include <cmath>

using namespace ecs;

static constexpr float kTurnRate = 10.0f; // slerp fraction per second

void CharacterMotorSystem::Update(World& world, float dt) {
    if (dt == 0.0f) return;

    auto* ctx_ptr = world.try_resource<std::shared_ptr<PhysicsContext>>();
    if (!ctx_ptr || !*ctx_ptr) return;
    auto& ctx = **ctx_ptr;

    world.each<CharacterHandle, tnua::Motor, WorldTransform>(
        [&](Entity e, CharacterHandle& h, tnua::Motor& motor, WorldTransform& wt) {
            auto* ch = h.character.get();

            // --- Velocity: one-shot boost plus integrated acceleration ---
            JPH::Vec3 vel = ch->GetLinearVelocity();
            vel += MathBridge::ToJolt(motor.lin.boost);
            vel += MathBridge::ToJolt(motor.lin.acceleration) * dt;
            ch->SetLinearVelocity(vel);

            // The boost has been consumed; acceleration is rewritten each frame.
            motor.lin.boost = {0, 0, 0};

            // --- Facing ---
            JPH::Vec3 forward = MathBridge::ToJolt(motor.desired_forward);
            if (forward.LengthSq() > 0.01f) {
                float     angle      = atan2f(forward.GetX(), forward.GetZ());
                JPH::Quat target_rot = JPH::Quat::sRotation(JPH::Vec3::sAxisY(), angle);
                ch->SetRotation(
                    ch->GetRotation().SLERP(target_rot, std::min(kTurnRate * dt, 1.0f)).Normalized());
            }

            // --- Extended Update (steps the character through the world) ---
            JPH::DefaultBroadPhaseLayerFilter bp_filter(
                ctx.object_vs_broadphase_layer_filter, Layers::MOVING);
            JPH::DefaultObjectLayerFilter obj_filter(
                ctx.object_layer_pair_filter, Layers::MOVING);
            JPH::BodyFilter  body_filter;
            JPH::ShapeFilter shape_filter;
            JPH::CharacterVirtual::ExtendedUpdateSettings ext_settings;

            ch->ExtendedUpdate(dt, ctx.GetGravity(), ext_settings,
                               bp_filter, obj_filter, body_filter, shape_filter,
                               *ctx.temp_allocator);

            // --- Sync Jolt position back to ECS transforms ---
            if (auto* lt = world.try_get<LocalTransform>(e)) {
                lt->position = MathBridge::FromJolt(ch->GetPosition());
                lt->rotation = MathBridge::FromJolt(ch->GetRotation());
                wt.matrix    = mat4_compose(lt->position, lt->rotation, lt->scale);
            }
        });
}

#pragma once
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Body/BodyActivationListener.h>
#include <raylib.h>
#include <algorithm>
#include <thread>

// Object layers: scene geometry vs. anything that moves (bodies, characters)
namespace Layers {
    static constexpr JPH::ObjectLayer NON_MOVING = 0;
    static constexpr JPH::ObjectLayer MOVING = 1;
    static constexpr JPH::ObjectLayer NUM_LAYERS = 2;
};

namespace BroadPhaseLayers {
    static constexpr JPH::BroadPhaseLayer NON_MOVING(0);
    static constexpr JPH::BroadPhaseLayer MOVING(1);
    static constexpr JPH::uint NUM_LAYERS(2);
};

// ---------------------------------------------------------------------------
// Layer tables required by JPH::PhysicsSystem::Init
// ---------------------------------------------------------------------------

class BPLayerInterfaceImpl final : public JPH::BroadPhaseLayerInterface {
public:
    BPLayerInterfaceImpl() {
        mObjectToBroadPhase[Layers::NON_MOVING] = BroadPhaseLayers::NON_MOVING;
        mObjectToBroadPhase[Layers::MOVING] = BroadPhaseLayers::MOVING;
    }

    virtual JPH::uint GetNumBroadPhaseLayers() const override {
        return BroadPhaseLayers::NUM_LAYERS;
    }

    virtual JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer inLayer) const override {
        JPH_ASSERT(inLayer < Layers::NUM_LAYERS);
        return mObjectToBroadPhase[inLayer];
    }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
    virtual const char *GetBroadPhaseLayerName(JPH::BroadPhaseLayer inLayer) const override {
        return inLayer == BroadPhaseLayers::NON_MOVING ? "NON_MOVING" : "MOVING";
    }
#endif // JPH_EXTERNAL_PROFILE || JPH_PROFILE_ENABLED

private:
    JPH::BroadPhaseLayer mObjectToBroadPhase[Layers::NUM_LAYERS];
};

class ObjectVsBroadPhaseLayerFilterImpl : public JPH::ObjectVsBroadPhaseLayerFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inLayer1, JPH::BroadPhaseLayer inLayer2) const override {
        // Static geometry never needs to test against other static geometry
        return inLayer1 == Layers::MOVING || inLayer2 == BroadPhaseLayers::MOVING;
    }
};

class ObjectLayerPairFilterImpl : public JPH::ObjectLayerPairFilter {
public:
    virtual bool ShouldCollide(JPH::ObjectLayer inObject1, JPH::ObjectLayer inObject2) const override {
        return inObject1 == Layers::MOVING || inObject2 == Layers::MOVING;
    }
};

// ---------------------------------------------------------------------------
// PhysicsContext: World resource owning the Jolt simulation.
//
// Stored as std::shared_ptr<PhysicsContext> so the World can hold it by value.
// Gravity is not applied to CharacterVirtual by Jolt; the controller bases
// read it from RigidBodyTracker::gravity, which the sensor system fills from
// here.
// ---------------------------------------------------------------------------

class PhysicsContext {
public:
    static constexpr JPH::uint kMaxBodies = 1024;
    static constexpr JPH::uint kMaxBodyPairs = 1024;
    static constexpr JPH::uint kMaxContactConstraints = 1024;
    static constexpr size_t kTempAllocatorBytes = 10 * 1024 * 1024;

    JPH::TempAllocatorImpl* temp_allocator = nullptr;
    JPH::JobSystemThreadPool* job_system = nullptr;
    JPH::PhysicsSystem* physics_system = nullptr;

    BPLayerInterfaceImpl broad_phase_layer_interface;
    ObjectVsBroadPhaseLayerFilterImpl object_vs_broadphase_layer_filter;
    ObjectLayerPairFilterImpl object_layer_pair_filter;

    // Must run once before the first PhysicsContext is constructed
    static void InitJoltAllocator() {
        JPH::RegisterDefaultAllocator();
    }

    PhysicsContext() {
        JPH::Factory::sInstance = new JPH::Factory();
        JPH::RegisterTypes();

        const int worker_threads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()) - 1);

        temp_allocator = new JPH::TempAllocatorImpl(kTempAllocatorBytes);
        job_system = new JPH::JobSystemThreadPool(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, worker_threads);

        physics_system = new JPH::PhysicsSystem();
        physics_system->Init(kMaxBodies, 0, kMaxBodyPairs, kMaxContactConstraints,
                             broad_phase_layer_interface, object_vs_broadphase_layer_filter,
                             object_layer_pair_filter);

        TraceLog(LOG_INFO, "PHYSICS: Jolt initialised (%d worker threads)", worker_threads);
    }

    ~PhysicsContext() {
        delete physics_system;
        delete job_system;
        delete temp_allocator;
        delete JPH::Factory::sInstance;
        JPH::Factory::sInstance = nullptr;
    }

    PhysicsContext(const PhysicsContext&) = delete;
    PhysicsContext& operator=(const PhysicsContext&) = delete;

    JPH::BodyInterface& GetBodyInterface() { return physics_system->GetBodyInterface(); }
    JPH::Vec3 GetGravity() const { return physics_system->GetGravity(); }
};

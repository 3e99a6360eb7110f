#pragma once
#include <ecs/ecs.hpp>
#include <utility>

namespace tnua {

// ---------------------------------------------------------------------------
// Sensor input (written in the Sensors stage, read by bases)
// ---------------------------------------------------------------------------

enum class GroundState { OnGround, OnSteepGround, NotSupported, InAir };

struct RigidBodyTracker {
    ecs::Vec3   translation   = {0, 0, 0};
    ecs::Vec3   velocity      = {0, 0, 0};
    ecs::Vec3   gravity       = {0, -9.81f, 0};
    GroundState ground        = GroundState::InAir;
    ecs::Vec3   ground_normal = {0, 1, 0};

    bool on_ground() const { return ground == GroundState::OnGround; }
};

// ---------------------------------------------------------------------------
// Motor output (written by bases, consumed in the Motors stage)
// ---------------------------------------------------------------------------

struct VelChange {
    ecs::Vec3 acceleration = {0, 0, 0}; // applied as acceleration * dt
    ecs::Vec3 boost        = {0, 0, 0}; // applied once, as-is
};

struct Motor {
    VelChange lin;
    ecs::Vec3 desired_forward = {0, 0, 0}; // zero keeps the current facing
};

// Read-only frame data handed to a basis.
struct BasisContext {
    float                   frame_duration;
    const RigidBodyTracker& tracker;
    ecs::Vec3               up_direction = {0, 1, 0};
};

// ---------------------------------------------------------------------------
// DynamicBasis: the type-erased interface a Controller stores.
//
// Concrete bases are plain configuration structs B with:
//   struct State { ... };                                   // default-constructible
//   void apply(State&, const BasisContext&, Motor&) const;  // one frame step
//
// BoxableBasis<B> binds a configuration to its running state. The Controller
// recovers the concrete wrapper with dynamic_cast to update it in place.
// ---------------------------------------------------------------------------

class DynamicBasis {
public:
    virtual ~DynamicBasis() = default;

    // Advance one frame.
    virtual void apply(const BasisContext& ctx, Motor& motor) = 0;
};

template<typename B>
class BoxableBasis final : public DynamicBasis {
public:
    explicit BoxableBasis(B basis) : input(std::move(basis)) {}

    void apply(const BasisContext& ctx, Motor& motor) override {
        input.apply(state, ctx, motor);
    }

    B                  input;
    typename B::State  state{};
};

} // namespace tnua

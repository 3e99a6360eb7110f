#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace tnua {

/**
 * @brief Manages groups of systems categorized by execution phase.
 *
 * Character control runs in four ordered stages inside update():
 * Sensors (physics -> RigidBodyTracker), User Controls (input -> basis
 * requests), Logic (BasisSystem advances every basis) and Motors
 * (Motor -> physics). Modules only choose a stage; the order is fixed here.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    void add_pre_update(SystemFunc func)    { pre_update_.push_back(std::move(func)); }
    void add_sensors(SystemFunc func)       { sensors_.push_back(std::move(func)); }
    void add_user_controls(SystemFunc func) { user_controls_.push_back(std::move(func)); }
    void add_logic(SystemFunc func)         { logic_.push_back(std::move(func)); }
    void add_motors(SystemFunc func)        { motors_.push_back(std::move(func)); }
    void add_physics(SystemFunc func)       { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func)        { render_.push_back(std::move(func)); }

    /**
     * @brief Executes the standard update flow.
     */
    void update(ecs::World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Character control stages
        for (auto& sys : sensors_)       sys(world, dt);
        for (auto& sys : user_controls_) sys(world, dt);
        for (auto& sys : logic_)         sys(world, dt);
        for (auto& sys : motors_)        sys(world, dt);

        // 3. Sync structural changes before physics / rendering
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems.
     */
    void step_physics(ecs::World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(ecs::World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> sensors_;
    std::vector<SystemFunc> user_controls_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> motors_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

} // namespace tnua

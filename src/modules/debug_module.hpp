#pragma once
#include "../controller.hpp"
#include "../debug_panel.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <cstdio>
#include <string>

// ---------------------------------------------------------------------------
// DebugModule
//
// Owns the DebugPanel resource and the overlay that draws it (F3).
// Engine rows: FPS, frame time, entity count, and how many controllers
// currently hold a basis.
//
// Install after RenderModule (the overlay draws over the scene) and before
// any module that adds rows or tunables of its own.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, tnua::Pipeline& pipeline) {
        DebugPanel panel;

        panel.watch("Engine", "FPS", []() { return std::to_string(GetFPS()); });
        panel.watch("Engine", "Frame Time", []() {
            char b[16];
            std::snprintf(b, sizeof(b), "%.1f ms", GetFrameTime() * 1000.0f);
            return std::string(b);
        });
        panel.watch("Engine", "Entities", [&world]() { return std::to_string(world.count()); });
        panel.watch("Engine", "Active Bases", [&world]() {
            int active = 0, total = 0;
            world.each<tnua::Controller>([&](ecs::Entity, tnua::Controller& c) {
                ++total;
                if (c.has_basis()) ++active;
            });
            return std::to_string(active) + " / " + std::to_string(total);
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }
};

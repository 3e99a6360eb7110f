#pragma once
#include "../pipeline.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Adds RenderSystem to the Render phase. Install before DebugModule so the
// overlay is drawn on top of the scene.
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& /*world*/, tnua::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::Update(w); });
    }
};

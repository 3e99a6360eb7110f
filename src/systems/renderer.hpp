#pragma once
#include <ecs/ecs.hpp>

// Draws every MeshRenderer from a camera trailing the player, plus the
// player's facing gizmo and the active basis name. Render phase; the main
// loop owns BeginDrawing/EndDrawing around Pipeline::render.
class RenderSystem {
public:
    static void Update(ecs::World& world);
};

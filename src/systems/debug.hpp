#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem: Render-phase system; drives the debug overlay.
//
// No Register(): no lifecycle hooks.
// Toggle visibility with F3. Added to the Render phase after RenderSystem so
// the overlay is drawn on top.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};

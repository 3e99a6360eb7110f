#include "controller_log.hpp"
#include "../events.hpp"
#include <raylib.h>

void ControllerLogSystem::Update(ecs::World& world, float /*dt*/) {
    if (const auto* evts = world.try_resource<Events<BasisSwitchedEvent>>()) {
        for (const auto& ev : evts->read()) {
            TraceLog(LOG_DEBUG, "CONTROLLER: basis '%s' -> '%s'",
                     ev.from.empty() ? "<none>" : ev.from.c_str(), ev.to.c_str());
        }
    }

    if (const auto* evts = world.try_resource<Events<JumpEvent>>()) {
        if (!evts->empty())
            TraceLog(LOG_DEBUG, "CONTROLLER: %d jump(s) started", static_cast<int>(evts->read().size()));
    }
}

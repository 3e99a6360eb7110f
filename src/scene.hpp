#pragma once
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// SceneLoader: reads JSON scene files and populates an ECS World.
//
// Components are added in lifecycle-safe order (colliders before rigid_body,
// transform and tuning before character) so on_add hooks fire with sibling
// data present. No Jolt or Raylib dependency, so it compiles in the headless
// test target.
//
// The whole document is validated before the first entity is spawned, so a
// failed load leaves the world untouched.
// ---------------------------------------------------------------------------

class SceneLoader {
public:
    // Load entities from a JSON file into world.
    // Returns false if the file cannot be opened or the JSON is malformed;
    // the reason is written to *error when given.
    static bool load(ecs::World& world, const std::string& path, std::string* error = nullptr);

    // Parse and spawn from a JSON string. Identical to load() but avoids
    // file I/O. Intended for unit testing.
    static bool load_from_string(ecs::World& world, const std::string& json,
                                 std::string* error = nullptr);

    // Destroy all WorldTag entities and flush deferred commands.
    static void unload(ecs::World& world);
};

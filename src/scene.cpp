#include "scene.hpp"
#include "components.hpp"
#include <ecs/modules/transform.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// Parsed entity description (everything optional, as in the file)
// ---------------------------------------------------------------------------

namespace {

struct EntityDesc {
    std::optional<ecs::LocalTransform>       transform;
    std::optional<BoxCollider>               box;
    std::optional<SphereCollider>            sphere;
    std::optional<MeshRenderer>              mesh;
    std::optional<RigidBodyConfig>           rigid_body;
    std::optional<CharacterControllerConfig> character;
    ControlTuning                            tuning;
    bool                                     world_tag  = false;
    bool                                     player_tag = false;
};

ecs::Vec3 parse_vec3(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>()};
}

ecs::Quat parse_quat(const json& j) {
    // stored as [x, y, z, w]
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

Color4 parse_color4(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>(), j.at(2).get<float>(), j.at(3).get<float>()};
}

ShapeType parse_shape(const std::string& s) {
    if (s == "Box")     return ShapeType::Box;
    if (s == "Sphere")  return ShapeType::Sphere;
    if (s == "Capsule") return ShapeType::Capsule;
    throw std::runtime_error("SceneLoader: unknown shape '" + s + "'");
}

BodyType parse_body_type(const std::string& s) {
    if (s == "Static")    return BodyType::Static;
    if (s == "Dynamic")   return BodyType::Dynamic;
    if (s == "Kinematic") return BodyType::Kinematic;
    throw std::runtime_error("SceneLoader: unknown body type '" + s + "'");
}

ControlTuning parse_tuning(const json& c) {
    ControlTuning t;
    t.walk_speed         = c.value("walk_speed",         t.walk_speed);
    t.acceleration       = c.value("acceleration",       t.acceleration);
    t.air_acceleration   = c.value("air_acceleration",   t.air_acceleration);
    t.coyote_time        = c.value("coyote_time",        t.coyote_time);
    t.jump_height        = c.value("jump_height",        t.jump_height);
    t.fall_extra_gravity = c.value("fall_extra_gravity", t.fall_extra_gravity);
    if (t.coyote_time < 0.0f || t.jump_height < 0.0f) {
        throw std::runtime_error("SceneLoader: controller timings and heights must be non-negative");
    }
    return t;
}

EntityDesc parse_entity(const json& e) {
    EntityDesc d;

    if (e.contains("transform")) {
        const auto& t = e["transform"];
        ecs::Vec3 pos = t.contains("position") ? parse_vec3(t["position"]) : ecs::Vec3{0,0,0};
        ecs::Quat rot = t.contains("rotation") ? parse_quat(t["rotation"]) : ecs::Quat{0,0,0,1};
        ecs::Vec3 scl = t.contains("scale")    ? parse_vec3(t["scale"])    : ecs::Vec3{1,1,1};
        d.transform = ecs::LocalTransform{pos, rot, scl};
    }

    if (e.contains("box_collider")) {
        d.box = BoxCollider{parse_vec3(e["box_collider"].at("half_extents"))};
    }
    if (e.contains("sphere_collider")) {
        d.sphere = SphereCollider{e["sphere_collider"].at("radius").get<float>()};
    }

    if (e.contains("mesh")) {
        const auto& m = e["mesh"];
        MeshRenderer mesh;
        mesh.shape_type   = parse_shape(m.value("shape", std::string("Box")));
        mesh.color        = m.contains("color")        ? parse_color4(m["color"])      : Colors::White;
        mesh.scale_offset = m.contains("scale_offset") ? parse_vec3(m["scale_offset"]) : ecs::Vec3{1,1,1};
        d.mesh = mesh;
    }

    if (e.contains("rigid_body")) {
        const auto& rb = e["rigid_body"];
        RigidBodyConfig cfg;
        cfg.type        = parse_body_type(rb.value("type", std::string("Dynamic")));
        cfg.mass        = rb.value("mass",        1.0f);
        cfg.friction    = rb.value("friction",    0.5f);
        cfg.restitution = rb.value("restitution", 0.0f);
        cfg.sensor      = rb.value("sensor",      false);
        d.rigid_body = cfg;
    }

    if (e.contains("character")) {
        const auto& ch = e["character"];
        CharacterControllerConfig cfg;
        cfg.height          = ch.value("height",          1.8f);
        cfg.radius          = ch.value("radius",          0.4f);
        cfg.mass            = ch.value("mass",            70.0f);
        cfg.max_slope_angle = ch.value("max_slope_angle", 45.0f);
        d.character = cfg;
    }
    if (e.contains("controller")) {
        d.tuning = parse_tuning(e["controller"]);
    }

    if (e.contains("tags")) {
        for (const auto& tag : e["tags"]) {
            const std::string t = tag.get<std::string>();
            if (t == "World")  d.world_tag  = true;
            if (t == "Player") d.player_tag = true;
        }
    }
    return d;
}

// ---------------------------------------------------------------------------
// Entity spawning
// ---------------------------------------------------------------------------

void spawn_entity(ecs::World& world, const EntityDesc& d) {
    auto ent = world.create();

    // 1. LocalTransform + WorldTransform (must precede physics hooks)
    if (d.transform) {
        world.add(ent, *d.transform);
        world.add(ent, ecs::WorldTransform{});
    }

    // 2. Colliders (must precede RigidBodyConfig so PhysicsSystem can read them)
    if (d.box)    world.add(ent, *d.box);
    if (d.sphere) world.add(ent, *d.sphere);

    // 3. Visual representation
    if (d.mesh) world.add(ent, *d.mesh);

    // 4. Physics / character (triggers on_add lifecycle hooks; added last so
    //    sibling components are already present when the hook fires)
    if (d.rigid_body) world.add(ent, *d.rigid_body);
    if (d.character) {
        world.add(ent, d.tuning);
        world.add(ent, *d.character);
    }

    // 5. Tags and player-specific components
    if (d.world_tag) world.add(ent, WorldTag{});
    if (d.player_tag) {
        world.add(ent, PlayerTag{});
        world.add(ent, PlayerInput{});
    }
}

} // namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

bool SceneLoader::load_from_string(ecs::World& world, const std::string& json_str,
                                   std::string* error) {
    std::vector<EntityDesc> entities;
    try {
        json scene = json::parse(json_str);
        for (const auto& entity_json : scene.at("entities")) {
            entities.push_back(parse_entity(entity_json));
        }
    } catch (const std::exception& ex) {
        if (error) *error = ex.what();
        return false;
    }

    for (const auto& d : entities) spawn_entity(world, d);
    return true;
}

bool SceneLoader::load(ecs::World& world, const std::string& path, std::string* error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        if (error) *error = "SceneLoader: cannot open '" + path + "'";
        return false;
    }
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return load_from_string(world, content, error);
}

void SceneLoader::unload(ecs::World& world) {
    std::vector<ecs::Entity> to_destroy;
    world.each<WorldTag>([&](ecs::Entity e, WorldTag&) { to_destroy.push_back(e); });
    for (auto e : to_destroy) world.destroy(e);
    world.deferred().flush(world);
}

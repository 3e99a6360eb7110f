#include "renderer.hpp"
#include "../components.hpp"
#include "../controller.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>
#include <string>

using namespace ecs;

// Camera sits behind (-Z) and above the player, looking along +Z, so the
// default PlayerInput view directions match what is on screen.
static constexpr Vector3 kCameraOffset = {0.0f, 8.0f, -16.0f};

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

void RenderSystem::Update(World& world) {
    ClearBackground({35, 35, 40, 255});

    Vector3     player_pos = {0, 0, 0};
    std::string basis_name = "-";
    world.single<PlayerTag, WorldTransform>([&](Entity e, PlayerTag&, WorldTransform& wt) {
        player_pos = {wt.matrix.m[12], wt.matrix.m[13], wt.matrix.m[14]};
        if (auto* c = world.try_get<tnua::Controller>(e)) {
            if (c->has_basis()) basis_name = c->basis_name();
        }
    });

    Camera3D camera   = {};
    camera.position   = Vector3Add(player_pos, kCameraOffset);
    camera.target     = Vector3Add(player_pos, {0, 1.0f, 0});
    camera.up         = {0, 1, 0};
    camera.fovy       = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;

    BeginMode3D(camera);
        DrawGrid(100, 2.0f);
        world.each<WorldTransform, MeshRenderer>(
            [&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
                rlPushMatrix();
                rlMultMatrixf(reinterpret_cast<float*>(&wt.matrix));
                Color col = to_raylib(mesh.color);
                switch (mesh.shape_type) {
                    case ShapeType::Box:     DrawCube({0,0,0}, 1.0f, 1.0f, 1.0f, col); break;
                    case ShapeType::Sphere:  DrawSphere({0,0,0}, 0.5f, col);            break;
                    case ShapeType::Capsule: {
                        float radius = 0.4f, height = 1.8f;
                        if (auto* cfg = world.try_get<CharacterControllerConfig>(e)) {
                            radius = cfg->radius;
                            height = cfg->height;
                        }
                        DrawCapsule({0, radius, 0}, {0, height - radius, 0}, radius, 8, 8, col);
                        break;
                    }
                }
                rlPopMatrix();

                // Facing gizmo on the player (local +Z)
                if (world.has<PlayerTag>(e)) {
                    Vector3 pos = {wt.matrix.m[12], wt.matrix.m[13] + 1.0f, wt.matrix.m[14]};
                    Vector3 fwd = {wt.matrix.m[8], wt.matrix.m[9], wt.matrix.m[10]};
                    DrawLine3D(pos, Vector3Add(pos, Vector3Scale(Vector3Normalize(fwd), 1.5f)), RED);
                }
            });
    EndMode3D();

    DrawFPS(10, 10);
    DrawText("WASD / L-STICK: Move | SPACE / SOUTH: Jump | R: Reload | F3: Debug", 10, 30, 20, LIGHTGRAY);
    DrawText(TextFormat("BASIS: %s", basis_name.c_str()), 10, 60, 20, YELLOW);
}

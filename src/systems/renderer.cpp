#include "renderer.hpp"
#include "ground_check.hpp"
#include "../camera_rig.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../debug_panel.hpp"
#include "../math_util.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <raylib.h>
#include <raymath.h>
#include <rlgl.h>

using namespace ecs;
using namespace locomotion;

static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

static void draw_mesh(const MeshRenderer& mesh, const CharacterControllerConfig* capsule) {
    const Color col = to_raylib(mesh.color);
    switch (mesh.shape_type) {
        case ShapeType::Box:    DrawCube({0, 0, 0}, 1.0f, 1.0f, 1.0f, col); break;
        case ShapeType::Sphere: DrawSphere({0, 0, 0}, 0.5f, col);          break;
        case ShapeType::Capsule: {
            const float h = capsule ? capsule->height : 1.8f;
            const float r = capsule ? capsule->radius : 0.4f;
            DrawCapsule({0, r, 0}, {0, h - r, 0}, r, 8, 8, col);
            break;
        }
    }
}

void RenderSystem::Update(World& world) {
    const auto* rigs = world.try_resource<CameraRigs>();
    if (!rigs) return;

    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    const bool first_person = !rigs->third_person.active();
    const auto* panel       = world.try_resource<DebugPanel>();
    const bool debug        = panel && panel->visible;

    BeginMode3D(rigs->active().camera());
        DrawGrid(100, 2.0f);

        world.each<WorldTransform, MeshRenderer>([&](Entity e, WorldTransform& wt, MeshRenderer& mesh) {
            // The body would fill the first-person view.
            if (first_person && world.has<PlayerTag>(e)) return;
            rlPushMatrix();
            rlMultMatrixf((float*)&wt.matrix);
            draw_mesh(mesh, world.try_get<CharacterControllerConfig>(e));
            rlPopMatrix();
        });

        if (debug) {
            if (const auto* config = world.try_resource<ControllerConfig>()) {
                world.each<ControllerState>([&](Entity, ControllerState& state) {
                    const ecs::Vec3 c = GroundCheckSystem::probe_center(state.pose, config->grounding);
                    DrawSphereWires(MathBridge::ToRaylib(c), config->grounding.radius, 8, 8,
                                    state.ground.grounded ? GREEN : RED);

                    const Vector3 chest = MathBridge::ToRaylib(math::add(state.pose.position, {0, 1.0f, 0}));
                    const Vector3 fwd   = MathBridge::ToRaylib(math::heading_forward(state.pose.yaw));
                    DrawLine3D(chest, Vector3Add(chest, Vector3Scale(fwd, 1.5f)), RED);
                });
            }
        }
    EndMode3D();

    DrawText("WASD / L-STICK: Move | SPACE / SOUTH: Jump | SHIFT: Sprint | C / NORTH: Switch View",
             10, GetScreenHeight() - 50, 18, LIGHTGRAY);
    DrawText("MOUSE / R-STICK: Look | SCROLL: Zoom | MMB: Reset Zoom | TAB: Cursor | R: Reload | F3: Debug",
             10, GetScreenHeight() - 28, 18, YELLOW);
    DrawText(first_person ? "VIEW: FIRST PERSON" : "VIEW: THIRD PERSON",
             GetScreenWidth() - 220, 10, 20, first_person ? SKYBLUE : GREEN);
}

void RenderSystem::Present(World& world) {
    if (!world.try_resource<CameraRigs>()) return;
    EndDrawing();
}

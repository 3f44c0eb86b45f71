#include "character_motor.hpp"
#include "player_controller.hpp"
#include "../animation.hpp"
#include "../camera_rig.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../events.hpp"
#include "../jolt_collaborators.hpp"
#include "../math_util.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include <Jolt/Physics/Collision/Shape/CapsuleShape.h>
#include <Jolt/Physics/Collision/Shape/RotatedTranslatedShape.h>
#include <ecs/modules/transform.hpp>
#include <ecs/integration/glm.hpp>
#include <memory>

using namespace ecs;
using namespace locomotion;

static PhysicsContext* context(World& w) {
    auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
    return (ctx_ptr && *ctx_ptr) ? ctx_ptr->get() : nullptr;
}

// Everything but the per-character Jolt collaborators.
static ControllerBindings shared_bindings(World& w, Entity e) {
    ControllerBindings b;
    if (auto* rigs = w.try_resource<CameraRigs>()) {
        b.first_person_rig = &rigs->first_person;
        b.third_person_rig = &rigs->third_person;
    }
    b.animator    = w.try_get<AnimatorParameters>(e);
    b.diagnostics = w.try_resource<Diagnostics>();
    b.jump_events = w.try_resource<Events<JumpEvent>>();
    b.view_events = w.try_resource<Events<ViewModeChangedEvent>>();
    return b;
}

static void sync_pose(World& w, Entity e, JPH::CharacterVirtual& ch, const CharacterPose& pose) {
    const ecs::Quat rot = math::quat_from_yaw(pose.yaw);
    ch.SetRotation(MathBridge::ToJolt(rot));

    if (auto* lt = w.try_get<LocalTransform>(e)) {
        lt->position = MathBridge::FromJolt(ch.GetPosition());
        lt->rotation = rot;
        if (auto* wt = w.try_get<WorldTransform>(e))
            wt->matrix = mat4_compose(lt->position, lt->rotation, lt->scale);
    }
}

void CharacterMotorSystem::Register(World& world) {
    world.on_add<CharacterControllerConfig>([](World& w, Entity e, CharacterControllerConfig& cfg) {
        auto* ctx = context(w);
        if (!ctx) return;

        // Capsule standing on the entity origin.
        const float half_cylinder = 0.5f * cfg.height - cfg.radius;
        JPH::RefConst<JPH::ShapeSettings> shape_settings =
            new JPH::RotatedTranslatedShapeSettings(
                JPH::Vec3(0, 0.5f * cfg.height, 0), JPH::Quat::sIdentity(),
                new JPH::CapsuleShapeSettings(half_cylinder, cfg.radius));

        auto shape_result = shape_settings->Create();
        if (shape_result.HasError()) {
            TraceLog(LOG_ERROR, "CONTROLLER: capsule creation failed: %s", shape_result.GetError().c_str());
            return;
        }

        JPH::RVec3 pos = JPH::RVec3::sZero();
        JPH::Quat  rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(math::quat_from_yaw(math::yaw_from_quat(lt->rotation)));
        }

        JPH::CharacterVirtualSettings settings;
        settings.mMass             = cfg.mass;
        settings.mMaxSlopeAngle    = JPH::DegreesToRadians(cfg.max_slope_angle);
        settings.mShape            = shape_result.Get();
        settings.mSupportingVolume = JPH::Plane(JPH::Vec3::sAxisY(), -cfg.radius);

        auto character = std::make_shared<JPH::CharacterVirtual>(&settings, pos, rot, ctx->physics_system);
        w.add(e, CharacterHandle{character});
    });
}

void CharacterMotorSystem::Update(World& world, float dt) {
    auto* ctx    = context(world);
    auto* config = world.try_resource<ControllerConfig>();
    if (!ctx || !config) return;

    world.each<CharacterHandle, PlayerInput, ControllerState>(
        [&](Entity e, CharacterHandle& h, PlayerInput& input, ControllerState& state) {
            JoltGroundProbe    probe(*ctx);
            JoltCharacterMover mover(*ctx, *h.character, config->push, config->gravity);

            ControllerBindings bindings = shared_bindings(world, e);
            bindings.ground_probe = &probe;
            bindings.mover        = &mover;

            PlayerControllerSystem::update(e, input, state, *config, bindings, dt);

            // Jolt's resolved position is authoritative.
            state.pose.position = MathBridge::FromJolt(h.character->GetPosition());
            sync_pose(world, e, *h.character, state.pose);
        });
}

void CharacterMotorSystem::LateUpdate(World& world, float dt) {
    auto* config = world.try_resource<ControllerConfig>();
    if (!config) return;

    world.each<CharacterHandle, PlayerInput, ControllerState>(
        [&](Entity e, CharacterHandle& h, PlayerInput& input, ControllerState& state) {
            const ControllerBindings bindings = shared_bindings(world, e);
            PlayerControllerSystem::late_update(input, state, *config, bindings, dt);
            sync_pose(world, e, *h.character, state.pose);
        });
}

#include "physics.hpp"
#include "../components.hpp"
#include "../physics_context.hpp"
#include "../physics_handles.hpp"
#include <ecs/modules/transform.hpp>
#include <memory>

using namespace ecs;

static PhysicsContext* context(World& w) {
    auto* ctx_ptr = w.try_resource<std::shared_ptr<PhysicsContext>>();
    return (ctx_ptr && *ctx_ptr) ? ctx_ptr->get() : nullptr;
}

void PhysicsSystem::Register(World& world) {
    world.on_add<RigidBodyConfig>([](World& w, Entity e, RigidBodyConfig& cfg) {
        if (w.has<RigidBodyHandle>(e)) return;
        auto* ctx = context(w);
        if (!ctx) return;

        JPH::RefConst<JPH::Shape> shape;
        if (auto* box = w.try_get<BoxCollider>(e)) {
            shape = new JPH::BoxShape(MathBridge::ToJolt(box->half_extents));
        } else if (auto* sphere = w.try_get<SphereCollider>(e)) {
            shape = new JPH::SphereShape(sphere->radius);
        } else {
            TraceLog(LOG_WARNING, "PHYSICS: rigid body without a collider, using a unit box");
            shape = new JPH::BoxShape(JPH::Vec3(0.5f, 0.5f, 0.5f));
        }

        // LocalTransform is authoritative at spawn; WorldTransform is not
        // propagated yet.
        JPH::RVec3 pos = JPH::RVec3::sZero();
        JPH::Quat  rot = JPH::Quat::sIdentity();
        if (auto* lt = w.try_get<LocalTransform>(e)) {
            pos = MathBridge::ToJolt(lt->position);
            rot = MathBridge::ToJolt(lt->rotation);
        }

        JPH::EMotionType motion = JPH::EMotionType::Dynamic;
        if (cfg.type == BodyType::Static)    motion = JPH::EMotionType::Static;
        if (cfg.type == BodyType::Kinematic) motion = JPH::EMotionType::Kinematic;

        const JPH::ObjectLayer layer = cfg.type == BodyType::Static ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(shape, pos, rot, motion, layer);
        settings.mRestitution = cfg.restitution;
        settings.mFriction    = cfg.friction;
        settings.mIsSensor    = cfg.sensor;
        if (motion == JPH::EMotionType::Dynamic) {
            settings.mOverrideMassProperties       = JPH::EOverrideMassProperties::CalculateInertia;
            settings.mMassPropertiesOverride.mMass = cfg.mass;
        }

        JPH::BodyInterface& bi = ctx->GetBodyInterface();
        JPH::Body* body = bi.CreateBody(settings);
        if (!body) {
            TraceLog(LOG_ERROR, "PHYSICS: body limit reached, entity left without a body");
            return;
        }
        bi.AddBody(body->GetID(), JPH::EActivation::Activate);
        w.add(e, RigidBodyHandle{body->GetID()});
    });

    world.on_remove<RigidBodyHandle>([](World& w, Entity, RigidBodyHandle& h) {
        auto* ctx = context(w);
        if (!ctx) return;
        JPH::BodyInterface& bi = ctx->GetBodyInterface();
        bi.RemoveBody(h.id);
        bi.DestroyBody(h.id);
    });
}

void PhysicsSystem::Update(World& world, float dt) {
    auto* ctx = context(world);
    if (!ctx) return;

    ctx->physics_system->Update(dt, 1, ctx->temp_allocator, ctx->job_system);

    // Only dynamic bodies are driven by the simulation.
    JPH::BodyInterface& bi = ctx->GetBodyInterface();
    world.each<RigidBodyHandle, RigidBodyConfig, LocalTransform>(
        [&](Entity, RigidBodyHandle& h, RigidBodyConfig& cfg, LocalTransform& lt) {
            if (cfg.type != BodyType::Dynamic) return;
            JPH::RVec3 pos;
            JPH::Quat  rot;
            bi.GetPositionAndRotation(h.id, pos, rot);
            lt.position = MathBridge::FromJolt(pos);
            lt.rotation = MathBridge::FromJolt(rot);
        });
}

#include "jolt_collaborators.hpp"
#include "math_util.hpp"
#include "physics_handles.hpp"
#include "systems/body_push.hpp"
#include <Jolt/Physics/Body/Body.h>
#include <Jolt/Physics/Collision/CollideShape.h>
#include <Jolt/Physics/Collision/CollisionCollectorImpl.h>
#include <Jolt/Physics/Collision/NarrowPhaseQuery.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>
#include <algorithm>

using namespace locomotion;

// ---------------------------------------------------------------------------
// JoltGroundProbe
// ---------------------------------------------------------------------------

bool JoltGroundProbe::overlaps(const ecs::Vec3& center, float radius, std::uint32_t layer_mask) const {
    JPH::SphereShape sphere(radius);
    sphere.SetEmbedded();

    JPH::CollideShapeSettings settings;
    settings.mActiveEdgeMode = JPH::EActiveEdgeMode::CollideOnlyWithActive;

    JPH::AnyHitCollisionCollector<JPH::CollideShapeCollector> collector;
    JPH::BroadPhaseLayerFilter bp_filter;
    LayerMaskFilter            layer_filter(layer_mask);
    SolidBodyFilter            body_filter;

    ctx_.physics_system->GetNarrowPhaseQuery().CollideShape(
        &sphere, JPH::Vec3::sReplicate(1.0f),
        JPH::RMat44::sTranslation(JPH::RVec3(center.x, center.y, center.z)),
        settings, JPH::RVec3::sZero(), collector, bp_filter, layer_filter, body_filter);

    return collector.HadHit();
}

// ---------------------------------------------------------------------------
// JoltCharacterMover
// ---------------------------------------------------------------------------

JoltCharacterMover::JoltCharacterMover(PhysicsContext& ctx, JPH::CharacterVirtual& character,
                                       const PushSettings& push, float gravity)
    : ctx_(ctx), character_(character), push_(push), gravity_(gravity) {
    character_.SetListener(this);
}

JoltCharacterMover::~JoltCharacterMover() {
    character_.SetListener(nullptr);
}

void JoltCharacterMover::OnContactAdded(const JPH::CharacterVirtual*, const JPH::BodyID& inBodyID2,
                                        const JPH::SubShapeID&, JPH::RVec3Arg,
                                        JPH::Vec3Arg inContactNormal, JPH::CharacterContactSettings&) {
    // Bodies are locked here; impulses are applied after the update.
    auto it = std::find_if(touched_.begin(), touched_.end(),
                           [&](const Touch& t) { return t.id == inBodyID2; });
    if (it == touched_.end())
        touched_.push_back({inBodyID2, MathBridge::FromJolt(inContactNormal)});
}

ecs::Vec3 JoltCharacterMover::move(const ecs::Vec3& displacement, float dt) {
    if (dt <= 0.0f) return {0, 0, 0};

    touched_.clear();
    const JPH::RVec3 before = character_.GetPosition();

    character_.SetLinearVelocity(MathBridge::ToJolt(displacement) / dt);

    JPH::DefaultBroadPhaseLayerFilter bp_filter(ctx_.object_vs_broadphase_layer_filter, Layers::MOVING);
    JPH::DefaultObjectLayerFilter     obj_filter(ctx_.object_layer_pair_filter, Layers::MOVING);
    SolidBodyFilter                   body_filter;
    JPH::ShapeFilter                  shape_filter;
    JPH::CharacterVirtual::ExtendedUpdateSettings ext_settings;

    character_.ExtendedUpdate(dt, JPH::Vec3(0.0f, gravity_, 0.0f), ext_settings,
                              bp_filter, obj_filter, body_filter, shape_filter,
                              *ctx_.temp_allocator);

    if (!touched_.empty()) apply_pushes(displacement);

    const JPH::Vec3 delta(character_.GetPosition() - before);
    return MathBridge::FromJolt(delta / dt);
}

void JoltCharacterMover::apply_pushes(const ecs::Vec3& displacement) {
    JPH::BodyInterface& bi = ctx_.GetBodyInterface();
    for (const Touch& touch : touched_) {
        const JPH::BodyID& id = touch.id;
        RigidBodyPush::Contact contact;
        contact.move_direction = RigidBodyPush::sweep_direction(displacement, touch.normal);
        contact.dynamic        = bi.GetMotionType(id) == JPH::EMotionType::Dynamic;
        contact.kinematic      = bi.GetMotionType(id) == JPH::EMotionType::Kinematic;
        contact.layer          = bi.GetObjectLayer(id);

        if (auto impulse = RigidBodyPush::impulse(push_, contact))
            bi.AddImpulse(id, MathBridge::ToJolt(*impulse));
    }
    touched_.clear();
}

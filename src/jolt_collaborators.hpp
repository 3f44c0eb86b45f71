#pragma once
#include "collaborators.hpp"
#include "config.hpp"
#include "physics_context.hpp"
#include <Jolt/Jolt.h>
#include <Jolt/Physics/Character/CharacterVirtual.h>
#include <vector>

// ---------------------------------------------------------------------------
// Jolt implementations of the controller's ground probe and mover.
//
// Both are cheap to construct and hold references only; CharacterMotorSystem
// builds a pair per player per frame.
// ---------------------------------------------------------------------------

// Object layers whose bit is set in `mask`.
class LayerMaskFilter final : public JPH::ObjectLayerFilter {
public:
    explicit LayerMaskFilter(std::uint32_t mask) : mask_(mask) {}
    bool ShouldCollide(JPH::ObjectLayer inLayer) const override {
        return (mask_ & layer_bit(inLayer)) != 0;
    }

private:
    std::uint32_t mask_;
};

// Rejects sensor (trigger) bodies.
class SolidBodyFilter final : public JPH::BodyFilter {
public:
    bool ShouldCollideLocked(const JPH::Body& inBody) const override { return !inBody.IsSensor(); }
};

class JoltGroundProbe final : public GroundProbe {
public:
    explicit JoltGroundProbe(const PhysicsContext& ctx) : ctx_(ctx) {}

    bool overlaps(const ecs::Vec3& center, float radius, std::uint32_t layer_mask) const override;

private:
    const PhysicsContext& ctx_;
};

// Drives a CharacterVirtual by a displacement per frame and shoves the
// dynamic bodies it touches on the way.
class JoltCharacterMover final : public CharacterMover, public JPH::CharacterContactListener {
public:
    JoltCharacterMover(PhysicsContext& ctx, JPH::CharacterVirtual& character,
                       const PushSettings& push, float gravity);
    ~JoltCharacterMover() override;

    ecs::Vec3 move(const ecs::Vec3& displacement, float dt) override;

    void OnContactAdded(const JPH::CharacterVirtual* inCharacter, const JPH::BodyID& inBodyID2,
                        const JPH::SubShapeID& inSubShapeID2, JPH::RVec3Arg inContactPosition,
                        JPH::Vec3Arg inContactNormal, JPH::CharacterContactSettings& ioSettings) override;

private:
    struct Touch {
        JPH::BodyID id;
        ecs::Vec3   normal;
    };

    void apply_pushes(const ecs::Vec3& displacement);

    PhysicsContext&            ctx_;
    JPH::CharacterVirtual&     character_;
    const PushSettings&        push_;
    float                      gravity_;
    std::vector<Touch>         touched_;
};

#include "body_push.hpp"
#include "../components.hpp"
#include "../math_util.hpp"

using namespace locomotion;

ecs::Vec3 RigidBodyPush::sweep_direction(const ecs::Vec3& displacement, const ecs::Vec3& contact_normal) {
    if (contact_normal.y > kSupportNormalY) return {0.0f, -1.0f, 0.0f};
    const ecs::Vec3 flat = math::normalized(math::flatten(displacement));
    if (math::length_sq(flat) == 0.0f) return math::normalized(displacement);
    return flat;
}

std::optional<ecs::Vec3> RigidBodyPush::impulse(const PushSettings& settings, const Contact& contact) {
    if (!settings.enabled) return std::nullopt;
    if (!contact.dynamic || contact.kinematic) return std::nullopt;
    if ((layer_bit(contact.layer) & settings.layers) == 0) return std::nullopt;
    if (contact.move_direction.y < kMinDirectionY) return std::nullopt;

    return ecs::Vec3{contact.move_direction.x * settings.strength, 0.0f,
                     contact.move_direction.z * settings.strength};
}

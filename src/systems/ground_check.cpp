#include "ground_check.hpp"

ecs::Vec3 GroundCheckSystem::probe_center(const CharacterPose& pose,
                                          const GroundingSettings& settings) {
    return {pose.position.x, pose.position.y - settings.offset, pose.position.z};
}

void GroundCheckSystem::check(const GroundProbe* probe, const CharacterPose& pose,
                              const GroundingSettings& settings, GroundState& ground,
                              AnimationSink* anim, Diagnostics* diagnostics) {
    if (!probe) {
        if (diagnostics)
            diagnostics->warn_once("ground_probe", "CONTROLLER: no ground probe bound, grounded state frozen");
        return;
    }
    if (diagnostics) diagnostics->clear("ground_probe");

    ground.grounded = probe->overlaps(probe_center(pose, settings), settings.radius, settings.layers);

    if (anim) anim->set_bool(AnimParam::Grounded, ground.grounded);
}

#pragma once
#include "../animation.hpp"
#include "../collaborators.hpp"
#include "../components.hpp"
#include "../config.hpp"
#include "../diagnostics.hpp"

// Sphere overlap below the feet. Refreshes GroundState::grounded and
// publishes the Grounded animation flag.
class GroundCheckSystem {
public:
    static ecs::Vec3 probe_center(const CharacterPose& pose, const GroundingSettings& settings);

    // With no probe bound, `ground` keeps its previous value and a warning
    // is reported once.
    static void check(const GroundProbe* probe, const CharacterPose& pose,
                      const GroundingSettings& settings, GroundState& ground,
                      AnimationSink* anim, Diagnostics* diagnostics);
};

#pragma once
#include "../components.hpp"
#include <ecs/ecs.hpp>

// Raises FootstepEvent and LandEvent from the controller's motion, standing
// in for the footfall markers an animation clip would carry.
class GaitSystem {
public:
    struct Step {
        bool  footstep = false;
        bool  landed   = false;
        float weight   = 0.0f; // blend weight of the clip raising the event
    };

    // Events below this weight come from a clip that is mostly blended out.
    static constexpr float kMinClipWeight = 0.5f;

    static bool passes_weight_gate(float weight) { return weight > kMinClipWeight; }

    // Weight of the moving clips for a normalized locomotion blend.
    static float clip_weight(float normalized_blend);

    // Accumulates grounded travel; one footstep per stride_length metres.
    // Landing is the airborne → grounded edge.
    static Step step(bool grounded, float horizontal_speed, float normalized_blend,
                     float stride_length, float dt, GaitState& gait);

    static void Update(ecs::World& world, float dt);
};

#pragma once
#include <raylib.h>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// AudioResource: clip handles for the controller's gait and jump events.
//
// Stored as a World resource. Loaded once after InitAudioDevice, unloaded
// before CloseAudioDevice. A missing file yields a zeroed Sound and
// PlaySound() on it is a no-op, so absent assets only silence the event.
// ---------------------------------------------------------------------------

struct AudioResource {
    static constexpr int kFootstepClips = 4;

    std::vector<Sound> footsteps; // one picked at random per step
    Sound              land{};
    Sound              jump{};

    void load() {
        footsteps.clear();
        for (int i = 1; i <= kFootstepClips; ++i)
            footsteps.push_back(LoadSound(("resources/sounds/footstep_0" + std::to_string(i) + ".wav").c_str()));
        land = LoadSound("resources/sounds/land.wav");
        jump = LoadSound("resources/sounds/jump.wav");
    }

    void unload() {
        for (auto& s : footsteps) UnloadSound(s);
        footsteps.clear();
        UnloadSound(land);
        UnloadSound(jump);
    }
};

#include "audio.hpp"
#include "gait.hpp"
#include "../audio_resource.hpp"
#include "../config.hpp"
#include "../events.hpp"
#include <raylib.h>

static void play(Sound& sound, float volume) {
    SetSoundVolume(sound, volume);
    PlaySound(sound);
}

void AudioSystem::Update(ecs::World& world, float /*dt*/) {
    auto* audio = world.try_resource<AudioResource>();
    if (!audio) return;

    float volume = 0.5f;
    if (const auto* config = world.try_resource<ControllerConfig>()) volume = config->footstep_volume;

    if (const auto* evts = world.try_resource<Events<FootstepEvent>>()) {
        for (const auto& ev : evts->read()) {
            if (!GaitSystem::passes_weight_gate(ev.clip_weight) || audio->footsteps.empty()) continue;
            const int pick = GetRandomValue(0, static_cast<int>(audio->footsteps.size()) - 1);
            play(audio->footsteps[pick], volume);
        }
    }

    if (const auto* evts = world.try_resource<Events<LandEvent>>()) {
        for (const auto& ev : evts->read()) {
            if (GaitSystem::passes_weight_gate(ev.clip_weight)) play(audio->land, volume);
        }
    }

    if (const auto* evts = world.try_resource<Events<JumpEvent>>()) {
        if (!evts->empty()) play(audio->jump, volume);
    }
}

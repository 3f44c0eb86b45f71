#pragma once
#include "../audio_resource.hpp"
#include "../pipeline.hpp"
#include "../systems/audio.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>

// ---------------------------------------------------------------------------
// AudioModule
//
// Opens the audio device, loads the footstep/land/jump clips and adds
// AudioSystem to the Logic phase. Install after ControllerModule so it runs after
// GaitSystem has emitted this frame's events.
//
// shutdown() unloads the clips and closes the device; call it before
// CloseWindow().
// ---------------------------------------------------------------------------

struct AudioModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline) {
        InitAudioDevice();
        if (!IsAudioDeviceReady())
            TraceLog(LOG_WARNING, "AUDIO: device unavailable, footsteps will be silent");
        AudioResource audio;
        audio.load();
        world.set_resource(std::move(audio));
        pipeline.add_logic([](ecs::World& w, float dt) { AudioSystem::Update(w, dt); });
    }

    static void shutdown(ecs::World& world) {
        world.resource<AudioResource>().unload();
        CloseAudioDevice();
    }
};

#pragma once
#include "../config.hpp"
#include "../diagnostics.hpp"
#include "../events.hpp"
#include "../pipeline.hpp"
#include <ecs/ecs.hpp>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// CoreModule
//
// Creates the resources every other module expects: EventRegistry,
// Diagnostics (reporting through `sink` when one is given) and
// ControllerConfig (loaded from `config_path`, defaults kept
// when the file is missing or malformed). Installs the event flush and the
// config hot-reload poll as the first Pre-Update steps.
//
// Must be installed first. No engine dependencies.
// ---------------------------------------------------------------------------

struct CoreModule {
    static void install(ecs::World& world, locomotion::Pipeline& pipeline,
                        const std::string& config_path, Diagnostics::Sink sink = {}) {
        world.set_resource(EventRegistry{});
        Diagnostics diagnostics;
        diagnostics.sink = std::move(sink);
        world.set_resource(std::move(diagnostics));

        ControllerConfig config;
        if (!ConfigLoader::load(config_path, config))
            world.resource<Diagnostics>().emit(Diagnostics::Level::Warning,
                                               "CONFIG: could not load " + config_path + ", using defaults");
        world.set_resource(std::move(config));
        world.set_resource(ConfigWatcher{config_path});

        pipeline.add_pre_update([](ecs::World& w, float) {
            w.resource<EventRegistry>().flush_all();
        });
        pipeline.add_pre_update([](ecs::World& w, float dt) {
            w.resource<ConfigWatcher>().poll(dt, w.resource<ControllerConfig>(),
                                             w.try_resource<Diagnostics>());
        });
    }
};

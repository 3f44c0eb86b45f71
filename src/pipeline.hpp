#pragma once
#include <ecs/ecs.hpp>
#include <functional>
#include <vector>

namespace locomotion {

/**
 * @brief Groups systems by execution phase.
 *
 * Per frame: pre_update → logic → flush → late_update → flush, then the
 * host steps physics at a fixed rate and finally renders. late_update runs
 * after the character has moved, so camera orientation is applied to this
 * frame's position.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    void add_pre_update(SystemFunc func)  { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func)       { logic_.push_back(std::move(func)); }
    void add_late_update(SystemFunc func) { late_update_.push_back(std::move(func)); }
    void add_physics(SystemFunc func)     { physics_.push_back(std::move(func)); }
    void add_render(SystemFunc func)      { render_.push_back(std::move(func)); }

    void update(ecs::World& world, float dt) {
        for (auto& sys : pre_update_) sys(world, dt);
        for (auto& sys : logic_) sys(world, dt);

        // Structural changes from logic (scene reload, despawns) land before
        // anything reads positions again.
        world.deferred().flush(world);

        for (auto& sys : late_update_) sys(world, dt);
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the fixed-step simulation systems.
     */
    void step_physics(ecs::World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    void render(ecs::World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    std::size_t system_count() const {
        return pre_update_.size() + logic_.size() + late_update_.size()
             + physics_.size() + render_.size();
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> late_update_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> render_;
};

} // namespace locomotion

#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase, and owns
 * the fixed-step accumulator for the physics phase.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    explicit Pipeline(float fixed_dt = 1.0f / 60.0f) : fixed_dt_(fixed_dt) {}

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func) { logic_.push_back(std::move(func)); }
    void add_physics(SystemFunc func) { physics_.push_back(std::move(func)); }
    void add_post_update(SystemFunc func) { post_update_.push_back(std::move(func)); }
    void add_render(SystemFunc func) { render_.push_back(std::move(func)); }

    /**
     * @brief Runs one frame: input, logic, as many fixed physics steps as
     * the accumulated time allows, then post-update (which sees events
     * emitted by both logic and physics this frame).
     * @return Number of physics steps executed this frame.
     */
    int advance(World& world, float dt) {
        if (dt < 0.0f) dt = 0.0f;

        update(world, dt);

        int steps = 0;
        accumulator_ += dt;
        while (accumulator_ >= fixed_dt_) {
            step_physics(world, fixed_dt_);
            accumulator_ -= fixed_dt_;
            ++steps;
        }

        for (auto& sys : post_update_) sys(world, dt);
        world.deferred().flush(world);
        return steps;
    }

    /**
     * @brief Executes the pre-update and logic phases once.
     */
    void update(World& world, float dt) {
        // 1. Input / Pre-processing
        for (auto& sys : pre_update_) sys(world, dt);

        // 2. Gameplay Logic
        for (auto& sys : logic_) sys(world, dt);

        // 3. Sync structural changes (e.g. spawned bursts) before physics
        world.deferred().flush(world);
    }

    /**
     * @brief Executes only the physics/simulation systems.
     */
    void step_physics(World& world, float dt) {
        for (auto& sys : physics_) sys(world, dt);
    }

    /**
     * @brief Executes rendering systems.
     */
    void render(World& world) {
        for (auto& sys : render_) sys(world, 0.0f);
    }

    // Drop any partial step, e.g. after a scene reload.
    void reset_accumulator() { accumulator_ = 0.0f; }

    float fixed_dt() const { return fixed_dt_; }

private:
    float fixed_dt_;
    float accumulator_ = 0.0f;

    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> physics_;
    std::vector<SystemFunc> post_update_;
    std::vector<SystemFunc> render_;
};

} // namespace ecs

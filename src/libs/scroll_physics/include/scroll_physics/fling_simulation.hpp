#pragma once

#include <scroll_host/scroll_simulation.hpp>
#include <scroll_model/types.hpp>
#include <box2d/box2d.h>
#include <memory>

namespace scroll_physics {

struct FlingSettings {
    float linear_damping = 2.0f;
    double min_fling_velocity = 50.0;
    double stop_velocity = 5.0;
};

// Fling along the scroll axis: a single body in a zero-gravity box2d world,
// slowed down by the body's linear damping. The body starts at the origin;
// offsets are reported relative to the start offset to keep float precision.
class FlingSimulation final : public scroll_host::ScrollSimulation {
public:
    FlingSimulation(double offset, double velocity, const scroll_model::ScrollExtent& extent,
        const FlingSettings& settings);
    ~FlingSimulation() override;

    FlingSimulation(const FlingSimulation&) = delete;
    FlingSimulation& operator=(const FlingSimulation&) = delete;

    void step(float dt) override;
    double offset() const override { return offset_; }
    double velocity() const override { return velocity_; }
    bool is_done() const override { return done_; }

private:
    void destroy_world();

    b2WorldId world_id_ = b2_nullWorldId;
    b2BodyId body_id_ = b2_nullBodyId;
    scroll_model::ScrollExtent extent_;
    FlingSettings settings_;
    double origin_ = 0.0;
    double offset_ = 0.0;
    double velocity_ = 0.0;
    bool done_ = false;

    static constexpr float kMinStep = 1.0f / 240.0f;
    static constexpr float kMaxStep = 1.0f / 30.0f;
};

class FlingSimulationFactory final : public scroll_host::SimulationFactory {
public:
    explicit FlingSimulationFactory(FlingSettings settings = {}) : settings_(settings) {}

    std::unique_ptr<scroll_host::ScrollSimulation> create_fling(double offset, double velocity,
        const scroll_model::ScrollExtent& extent) const override;

    const FlingSettings& settings() const { return settings_; }

private:
    FlingSettings settings_;
};

} // namespace scroll_physics

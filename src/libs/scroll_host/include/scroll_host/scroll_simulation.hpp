#pragma once

#include <scroll_model/types.hpp>
#include <memory>

namespace scroll_host {

// Step-driven motion used by BallisticActivity. Offsets are absolute.
class ScrollSimulation {
public:
    virtual ~ScrollSimulation() = default;

    virtual void step(float dt) = 0;
    virtual double offset() const = 0;
    virtual double velocity() const = 0;
    virtual bool is_done() const = 0;
};

class SimulationFactory {
public:
    virtual ~SimulationFactory() = default;

    // Returns nullptr when the velocity is too small to start a fling.
    virtual std::unique_ptr<ScrollSimulation> create_fling(double offset, double velocity,
        const scroll_model::ScrollExtent& extent) const = 0;
};

} // namespace scroll_host

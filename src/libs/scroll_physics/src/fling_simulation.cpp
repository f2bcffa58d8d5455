#include <scroll_physics/fling_simulation.hpp>
#include <scroll_host/log.hpp>
#include <algorithm>
#include <cmath>

namespace scroll_physics {

namespace {

constexpr int kSubSteps = 4;
constexpr float kMaxLinearSpeed = 100000.0f;
// box2d caps a body's speed by its size per substep; a large box keeps that
// cap above any fling speed.
constexpr float kBodyHalfExtent = 1000.0f;

} // namespace

FlingSimulation::FlingSimulation(double offset, double velocity, const scroll_model::ScrollExtent& extent,
    const FlingSettings& settings)
    : extent_(extent), settings_(settings), origin_(offset), offset_(offset), velocity_(velocity)
{
    if (std::abs(velocity) < settings_.stop_velocity || !extent_.contains(offset)) {
        done_ = true;
        return;
    }

    b2WorldDef world_def = b2DefaultWorldDef();
    world_def.gravity = b2Vec2{0.0f, 0.0f};
    world_def.maximumLinearSpeed = kMaxLinearSpeed;
    world_id_ = b2CreateWorld(&world_def);

    b2BodyDef body_def = b2DefaultBodyDef();
    body_def.type = b2_dynamicBody;
    body_def.position = b2Vec2{0.0f, 0.0f};
    body_def.linearVelocity = b2Vec2{static_cast<float>(velocity), 0.0f};
    body_def.linearDamping = settings_.linear_damping;
    body_def.gravityScale = 0.0f;
    body_def.enableSleep = false;
    body_id_ = b2CreateBody(world_id_, &body_def);

    b2ShapeDef shape_def = b2DefaultShapeDef();
    shape_def.density = 1.0f;
    b2Polygon poly = b2MakeBox(kBodyHalfExtent, kBodyHalfExtent);
    b2CreatePolygonShape(body_id_, &shape_def, &poly);
}

FlingSimulation::~FlingSimulation() {
    destroy_world();
}

void FlingSimulation::destroy_world() {
    if (b2World_IsValid(world_id_)) {
        b2DestroyWorld(world_id_);
    }
    world_id_ = b2_nullWorldId;
    body_id_ = b2_nullBodyId;
}

void FlingSimulation::step(float dt) {
    if (done_ || !b2World_IsValid(world_id_) || !b2Body_IsValid(body_id_)) return;

    const float clamped_dt = std::clamp(dt, kMinStep, kMaxStep);
    b2World_Step(world_id_, clamped_dt, kSubSteps);

    const b2Vec2 p = b2Body_GetPosition(body_id_);
    const b2Vec2 v = b2Body_GetLinearVelocity(body_id_);
    offset_ = origin_ + static_cast<double>(p.x);
    velocity_ = static_cast<double>(v.x);

    if (!extent_.contains(offset_)) {
        offset_ = extent_.clamp(offset_);
        velocity_ = 0.0;
        done_ = true;
    } else if (std::abs(velocity_) < settings_.stop_velocity) {
        velocity_ = 0.0;
        done_ = true;
    }

    if (done_) destroy_world();
}

std::unique_ptr<scroll_host::ScrollSimulation> FlingSimulationFactory::create_fling(double offset,
    double velocity, const scroll_model::ScrollExtent& extent) const
{
    if (std::abs(velocity) < settings_.min_fling_velocity) return nullptr;
    scroll_host::scroll_logger()->debug("fling_started offset={} velocity={}", offset, velocity);
    return std::make_unique<FlingSimulation>(offset, velocity, extent, settings_);
}

} // namespace scroll_physics

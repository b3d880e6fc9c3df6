/// @file physics.hpp
/// @brief Umbrella header for impulse_physics
///
/// A pendulum swinging through a trigger volume above a ground plane:
/// ```cpp
/// #include <impulse/physics/physics.hpp>
///
/// using namespace impulse_physics::prelude;
///
/// PhysicsWorld world;  // default PhysicsWorldConfig, 60 Hz fixed step
///
/// BodyId ground = world.create_body(
///     BodyBuilder().static_body().with_plane({0, 1, 0}, 0.0f).build()).unwrap();
/// BodyId pivot = world.create_body(
///     BodyBuilder().static_body().position(0, 4, 0).build()).unwrap();
/// BodyId bob = world.create_body(
///     BodyBuilder().dynamic_body().position(2, 4, 0).mass(3.0f).with_sphere(0.25f).build()).unwrap();
/// world.create_body(
///     BodyBuilder().static_body().position(0, 2, 0).with_box({0.5f, 0.5f, 0.5f}).trigger().build()).unwrap();
///
/// world.create_joint(JointDesc::distance(pivot, bob, {0, 4, 0}, {2, 4, 0})).unwrap();
///
/// world.on_trigger_enter([](const TriggerEvent& e) {
///     IMPULSE_LOG_INFO("body {} passed the gate", e.other_body.value);
/// });
///
/// for (int frame = 0; frame < 600; ++frame) {
///     world.step(1.0f / 60.0f);
/// }
/// if (const auto* state = world.snapshot().find(bob)) {
///     // state->position, state->rotation ...
/// }
/// ```
///
/// Errors come back as impulse_core::Result; messages go to the "impulse"
/// spdlog logger (see impulse_core::configure_logging).

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "config.hpp"
#include "shape.hpp"
#include "body.hpp"
#include "joint.hpp"
#include "query.hpp"
#include "events.hpp"
#include "world.hpp"

#include <impulse/core/log.hpp>

namespace impulse_physics {

/// Prelude - commonly used types
namespace prelude {
    using impulse_physics::PhysicsWorld;
    using impulse_physics::PhysicsWorldConfig;
    using impulse_physics::PhysicsStats;
    using impulse_physics::WorldSnapshot;

    using impulse_physics::RigidBody;
    using impulse_physics::RigidBodyDesc;
    using impulse_physics::BodyBuilder;
    using impulse_physics::BodyId;
    using impulse_physics::BodyType;
    using impulse_physics::Collider;

    using impulse_physics::Shape;
    using impulse_physics::SphereShape;
    using impulse_physics::AabbShape;
    using impulse_physics::BoxShape;
    using impulse_physics::CapsuleShape;
    using impulse_physics::ConvexHullShape;
    using impulse_physics::PlaneShape;
    using impulse_physics::CompoundShape;

    using impulse_physics::JointDesc;
    using impulse_physics::JointId;
    using impulse_physics::JointType;

    using impulse_physics::RaycastHit;
    using impulse_physics::QueryFilter;
    using impulse_physics::CollisionEvent;
    using impulse_physics::TriggerEvent;
    using impulse_physics::ContactPhase;

    using impulse_physics::CollisionMask;
    using impulse_physics::CollisionLayer;
} // namespace prelude

} // namespace impulse_physics

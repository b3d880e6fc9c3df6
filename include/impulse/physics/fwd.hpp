/// @file fwd.hpp
/// @brief Forward declarations for impulse_physics

#pragma once

#include <cstdint>

namespace impulse_physics {

// Enums
enum class BodyType : std::uint8_t;
enum class ShapeType : std::uint8_t;
enum class JointType : std::uint8_t;
enum class CcdMode : std::uint8_t;
enum class CapsuleAxis : std::uint8_t;

// Identifiers
struct BodyTag;
struct JointTag;
template<typename Tag> struct Id;
using BodyId = Id<BodyTag>;
using JointId = Id<JointTag>;

// Configuration
struct PhysicsWorldConfig;
struct PhysicsStats;

// Shapes
struct SphereShape;
struct AabbShape;
struct BoxShape;
struct CapsuleShape;
struct ConvexHullShape;
struct PlaneShape;
struct CompoundShape;
struct CompoundChild;
struct MassProperties;

// Bodies
struct Collider;
struct RigidBodyDesc;
class RigidBody;

// Collision
struct ShapeProxy;
struct ContactPoint;
struct ContactManifold;
struct ManifoldKey;
class ContactCache;
class SpatialHashGrid;

// Solver
struct SolverBody;
struct ContactConstraint;
class ContactSolver;
class IslandSolver;

// Joints
struct JointDesc;
class IJointConstraint;

// Islands
struct Island;
class IslandBuilder;

// Queries and events
struct RaycastHit;
struct TimeOfImpact;
struct CollisionEvent;
struct TriggerEvent;

// World
class PhysicsWorld;

} // namespace impulse_physics

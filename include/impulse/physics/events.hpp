/// @file events.hpp
/// @brief Collision and trigger events for impulse_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "contact.hpp"
#include "broadphase.hpp"

#include <impulse/math/vec.hpp>

#include <cstdint>
#include <functional>
#include <set>
#include <vector>

namespace impulse_physics {

// =============================================================================
// Events
// =============================================================================

/// Transition of a pair between two steps
enum class ContactPhase : std::uint8_t {
    Enter,
    Stay,
    Exit,
};

[[nodiscard]] const char* to_string(ContactPhase phase);

/// Collision event
struct CollisionEvent {
    BodyId body_a;
    BodyId body_b;
    ContactPhase type = ContactPhase::Enter;
    ContactManifold manifold;             ///< Deepest manifold of the pair; empty on exit
    float total_impulse = 0.0f;           ///< Normal impulse over all of the pair's manifolds
};

/// Trigger event
struct TriggerEvent {
    BodyId trigger_body;
    BodyId other_body;
    ContactPhase type = ContactPhase::Enter;
};

/// Collision callback types
using CollisionCallback = std::function<void(const CollisionEvent&)>;
using TriggerCallback = std::function<void(const TriggerEvent&)>;

// =============================================================================
// Event Tracker
// =============================================================================

/// Turns each step's manifolds into enter/stay/exit events per body pair.
/// A solid pair touches while the narrowphase reports a manifold for it; a
/// trigger pair only while the shapes actually overlap.
class ContactEventTracker {
public:
    /// Pairs that produced no manifold but should neither exit nor stay
    /// (both bodies asleep)
    using DormantPredicate = std::function<bool(const BodyPair&)>;

    /// Tells which body of a trigger pair carries the trigger collider
    using TriggerPredicate = std::function<bool(BodyId)>;

    /// Compare the current manifolds with the previous step
    void update(const std::vector<ContactManifold>& manifolds,
                const TriggerPredicate& is_trigger_body,
                const DormantPredicate& is_dormant);

    [[nodiscard]] const std::vector<CollisionEvent>& collision_events() const noexcept { return m_collision_events; }
    [[nodiscard]] const std::vector<TriggerEvent>& trigger_events() const noexcept { return m_trigger_events; }

    /// Number of solid pairs currently touching
    [[nodiscard]] std::size_t touching_count() const noexcept { return m_touching.size(); }

    /// Forget all pairs without emitting events
    void clear();

private:
    std::set<BodyPair> m_touching;
    std::set<BodyPair> m_overlapping;      ///< Trigger pairs
    std::set<BodyPair> m_trigger_a;        ///< Trigger pairs whose first body is the trigger

    std::vector<CollisionEvent> m_collision_events;
    std::vector<TriggerEvent> m_trigger_events;
};

// =============================================================================
// Callbacks
// =============================================================================

/// User callbacks, invoked at the end of each fixed step. Exceptions derived
/// from std::exception are logged and do not interrupt the step.
struct EventCallbacks {
    CollisionCallback on_collision_enter;
    CollisionCallback on_collision_stay;
    CollisionCallback on_collision_exit;
    TriggerCallback on_trigger_enter;
    TriggerCallback on_trigger_stay;
    TriggerCallback on_trigger_exit;

    /// Invoke the callback matching each event
    void dispatch(const ContactEventTracker& tracker) const;
};

} // namespace impulse_physics

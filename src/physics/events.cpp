/// @file events.cpp
/// @brief Contact event tracking and callback dispatch

#include <impulse/physics/events.hpp>
#include <impulse/core/log.hpp>

#include <algorithm>
#include <exception>
#include <map>

namespace impulse_physics {

const char* to_string(ContactPhase phase) {
    switch (phase) {
        case ContactPhase::Enter: return "Enter";
        case ContactPhase::Stay: return "Stay";
        case ContactPhase::Exit: return "Exit";
    }
    return "Unknown";
}

// =============================================================================
// ContactEventTracker Implementation
// =============================================================================

void ContactEventTracker::update(const std::vector<ContactManifold>& manifolds,
                                 const TriggerPredicate& is_trigger_body,
                                 const DormantPredicate& is_dormant) {
    m_collision_events.clear();
    m_trigger_events.clear();

    // Group manifolds per body pair; compounds may report several
    std::map<BodyPair, std::vector<const ContactManifold*>> solid;
    std::set<BodyPair> overlapping;
    for (const auto& m : manifolds) {
        if (m.empty()) {
            continue;
        }
        const BodyPair pair = BodyPair::make(m.body_a, m.body_b);
        if (m.is_trigger) {
            if (m.min_separation() <= 0.0f) {
                overlapping.insert(pair);
            }
        } else {
            solid[pair].push_back(&m);
        }
    }

    // Collision begin and stay
    std::set<BodyPair> touching;
    for (const auto& [pair, list] : solid) {
        touching.insert(pair);

        const auto deepest = std::min_element(list.begin(), list.end(),
            [](const ContactManifold* x, const ContactManifold* y) {
                return x->min_separation() < y->min_separation();
            });

        CollisionEvent event;
        event.body_a = pair.body_a;
        event.body_b = pair.body_b;
        event.type = m_touching.count(pair) ? ContactPhase::Stay : ContactPhase::Enter;
        event.manifold = **deepest;
        for (const ContactManifold* m : list) {
            event.total_impulse += m->total_normal_impulse();
        }
        m_collision_events.push_back(std::move(event));
    }

    // Collision end
    for (const auto& pair : m_touching) {
        if (touching.count(pair)) {
            continue;
        }
        if (is_dormant && is_dormant(pair)) {
            touching.insert(pair);
            continue;
        }
        CollisionEvent event;
        event.body_a = pair.body_a;
        event.body_b = pair.body_b;
        event.type = ContactPhase::Exit;
        m_collision_events.push_back(std::move(event));
    }
    m_touching = std::move(touching);

    // Trigger enter and stay
    for (const auto& pair : overlapping) {
        const bool was_overlapping = m_overlapping.count(pair) > 0;
        if (!was_overlapping && is_trigger_body && is_trigger_body(pair.body_a)) {
            m_trigger_a.insert(pair);
        }
        const bool a_is_trigger = m_trigger_a.count(pair) > 0;

        TriggerEvent event;
        event.trigger_body = a_is_trigger ? pair.body_a : pair.body_b;
        event.other_body = a_is_trigger ? pair.body_b : pair.body_a;
        event.type = was_overlapping ? ContactPhase::Stay : ContactPhase::Enter;
        m_trigger_events.push_back(event);
    }

    // Trigger exit
    for (const auto& pair : m_overlapping) {
        if (overlapping.count(pair)) {
            continue;
        }
        if (is_dormant && is_dormant(pair)) {
            overlapping.insert(pair);
            continue;
        }
        const bool a_is_trigger = m_trigger_a.erase(pair) > 0;

        TriggerEvent event;
        event.trigger_body = a_is_trigger ? pair.body_a : pair.body_b;
        event.other_body = a_is_trigger ? pair.body_b : pair.body_a;
        event.type = ContactPhase::Exit;
        m_trigger_events.push_back(event);
    }
    m_overlapping = std::move(overlapping);
}

void ContactEventTracker::clear() {
    m_touching.clear();
    m_overlapping.clear();
    m_trigger_a.clear();
    m_collision_events.clear();
    m_trigger_events.clear();
}

// =============================================================================
// EventCallbacks Implementation
// =============================================================================

namespace {

template<typename Event>
void invoke_guarded(const std::function<void(const Event&)>& callback, const Event& event, const char* name) {
    if (!callback) {
        return;
    }
    try {
        callback(event);
    } catch (const std::exception& e) {
        IMPULSE_LOG_WARN("{} callback threw: {}", name, e.what());
    }
}

} // anonymous namespace

void EventCallbacks::dispatch(const ContactEventTracker& tracker) const {
    for (const auto& event : tracker.collision_events()) {
        switch (event.type) {
            case ContactPhase::Enter: invoke_guarded(on_collision_enter, event, "Collision enter"); break;
            case ContactPhase::Stay: invoke_guarded(on_collision_stay, event, "Collision stay"); break;
            case ContactPhase::Exit: invoke_guarded(on_collision_exit, event, "Collision exit"); break;
        }
    }
    for (const auto& event : tracker.trigger_events()) {
        switch (event.type) {
            case ContactPhase::Enter: invoke_guarded(on_trigger_enter, event, "Trigger enter"); break;
            case ContactPhase::Stay: invoke_guarded(on_trigger_stay, event, "Trigger stay"); break;
            case ContactPhase::Exit: invoke_guarded(on_trigger_exit, event, "Trigger exit"); break;
        }
    }
}

} // namespace impulse_physics

/// @file ccd.cpp
/// @brief Swept time of impact implementation

#include <impulse/physics/ccd.hpp>
#include <impulse/physics/body.hpp>

#include <algorithm>
#include <cmath>
#include <vector>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Transform;

namespace {

/// Smallest step between sweep samples (m)
constexpr float k_min_sample_step = 1e-3f;

Transform moved(const Transform& start, const Vec3& translation, float t) {
    Transform result = start;
    result.position += translation * t;
    return result;
}

bool touching(const Shape& a, const Transform& ta, const Shape& b, const Transform& tb,
              std::vector<ShapeContact>& scratch) {
    scratch.clear();
    collide(a, ta, b, tb, scratch, 0.0f);
    for (const auto& contact : scratch) {
        for (const auto& p : contact.points) {
            if (p.separation <= 0.0f) {
                return true;
            }
        }
    }
    return false;
}

} // anonymous namespace

TimeOfImpact compute_toi(const Shape& shape_a, const Transform& start_a, const Vec3& translation_a,
                         const Shape& shape_b, const Transform& start_b, const Vec3& translation_b,
                         std::uint32_t max_iterations) {
    TimeOfImpact result;

    if (is_degenerate(shape_a) || is_degenerate(shape_b)) {
        result.state = TimeOfImpact::State::Failed;
        return result;
    }

    // Relative velocity
    const Vec3 relative = translation_a - translation_b;
    const float travel = impulse_math::length(relative);
    if (travel < impulse_math::consts::EPSILON) {
        return result;
    }

    std::vector<ShapeContact> scratch;
    if (touching(shape_a, start_a, shape_b, start_b, scratch)) {
        result.state = TimeOfImpact::State::Overlapping;
        result.t = 0.0f;
        return result;
    }

    const float step = std::max(std::min(min_half_thickness(shape_a), min_half_thickness(shape_b)),
                                k_min_sample_step);
    const auto samples = static_cast<std::uint32_t>(
        std::clamp(std::ceil(travel / step), 1.0f, static_cast<float>(k_ccd_max_samples)));

    float t_min = 0.0f;
    float t_max = -1.0f;
    for (std::uint32_t s = 1; s <= samples; ++s) {
        const float t = static_cast<float>(s) / static_cast<float>(samples);
        if (touching(shape_a, moved(start_a, translation_a, t), shape_b, moved(start_b, translation_b, t), scratch)) {
            t_max = t;
            break;
        }
        t_min = t;
    }

    if (t_max < 0.0f) {
        return result;
    }

    // Binary search for TOI
    for (std::uint32_t i = 0; i < max_iterations; ++i) {
        const float t = (t_min + t_max) * 0.5f;
        if (touching(shape_a, moved(start_a, translation_a, t), shape_b, moved(start_b, translation_b, t), scratch)) {
            t_max = t;
        } else {
            t_min = t;
        }
        if ((t_max - t_min) * travel < impulse_math::consts::TOLERANCE) {
            break;
        }
    }

    // Get contact info at TOI, wide enough to reach across the remaining gap
    const float margin = k_contact_margin + (t_max - t_min) * travel;
    scratch.clear();
    collide(shape_a, moved(start_a, translation_a, t_min), shape_b, moved(start_b, translation_b, t_min),
            scratch, margin);
    if (scratch.empty()) {
        result.state = TimeOfImpact::State::Failed;
        return result;
    }

    const auto deepest = std::min_element(scratch.begin(), scratch.end(),
        [](const ShapeContact& x, const ShapeContact& y) {
            const auto min_sep = [](const ShapeContact& c) {
                float best = impulse_math::consts::MAX_FLOAT;
                for (const auto& p : c.points) {
                    best = std::min(best, p.separation);
                }
                return best;
            };
            return min_sep(x) < min_sep(y);
        });

    result.state = TimeOfImpact::State::Hit;
    result.t = t_min;
    result.contact = *deepest;
    return result;
}

bool needs_sweep(const RigidBody& body, float velocity_threshold) noexcept {
    return body.is_dynamic()
        && !body.is_sleeping()
        && body.ccd_mode() == CcdMode::Swept
        && body.has_collider()
        && !body.is_trigger()
        && impulse_math::length(body.linear_velocity()) > velocity_threshold;
}

} // namespace impulse_physics

/// @file query.cpp
/// @brief Ray query implementations

#include <impulse/physics/query.hpp>
#include <impulse/physics/body.hpp>

#include <cmath>
#include <limits>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Ray;
using impulse_math::RayHit;
using impulse_math::Transform;

namespace {

/// Cyrus-Beck clipping of a local ray against the hull's face planes
std::optional<RayHit> ray_hull(const Ray& ray, const ConvexHullShape& hull) {
    float t_near = -std::numeric_limits<float>::max();
    float t_far = std::numeric_limits<float>::max();
    Vec3 near_normal = impulse_math::vec3::UP;
    Vec3 far_normal = impulse_math::vec3::UP;

    for (const auto& face : hull.faces) {
        const float denom = impulse_math::dot(face.normal, ray.direction);
        const float dist = face.offset - impulse_math::dot(face.normal, ray.origin);

        if (std::abs(denom) < impulse_math::consts::EPSILON) {
            if (dist < 0.0f) {
                return std::nullopt;  // Parallel and outside
            }
            continue;
        }

        const float t = dist / denom;
        if (denom < 0.0f) {
            if (t > t_near) {
                t_near = t;
                near_normal = face.normal;
            }
        } else if (t < t_far) {
            t_far = t;
            far_normal = face.normal;
        }

        if (t_near > t_far) {
            return std::nullopt;
        }
    }

    if (t_far < 0.0f) {
        return std::nullopt;
    }
    if (t_near < 0.0f) {
        // Inside: report the exit face
        return std::make_pair(t_far, far_normal);
    }
    return std::make_pair(t_near, near_normal);
}

} // anonymous namespace

bool QueryFilter::accepts(const RigidBody& body) const noexcept {
    if (!body.has_collider()) {
        return false;
    }
    if (body.is_trigger() && !include_triggers) {
        return false;
    }
    return (body.collider()->mask.layer & layer_mask) != 0;
}

std::optional<RayHit> raycast_shape(const Shape& shape, const Transform& transform,
                                    const Ray& ray, float max_distance) {
    // Transform ray to local space
    const Ray local(transform.inverse_transform_point(ray.origin),
                    transform.inverse_transform_vector(ray.direction));

    auto to_world = [&transform](const std::optional<RayHit>& hit) -> std::optional<RayHit> {
        if (!hit) {
            return std::nullopt;
        }
        return std::make_pair(hit->first, impulse_math::normalize(transform.transform_vector(hit->second)));
    };

    std::optional<RayHit> result = std::visit([&](const auto& s) -> std::optional<RayHit> {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return to_world(impulse_math::ray_sphere_with_normal(local, impulse_math::vec3::ZERO, s.radius));
        } else if constexpr (std::is_same_v<T, AabbShape>) {
            // Stays world aligned
            return impulse_math::ray_aabb_with_normal(
                ray, impulse_math::AABB::from_center_half_extents(transform.position, s.half_extents));
        } else if constexpr (std::is_same_v<T, BoxShape>) {
            return to_world(impulse_math::ray_aabb_with_normal(local, impulse_math::AABB(-s.half_extents, s.half_extents)));
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const auto [a, b] = s.endpoints();
            return to_world(impulse_math::ray_capsule_with_normal(local, a, b, s.radius));
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            return to_world(ray_hull(local, s));
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return to_world(impulse_math::ray_half_space(local, s.normal, s.offset));
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            std::optional<RayHit> best;
            for (const auto& child : s.children) {
                auto hit = raycast_shape(child.shape, transform.combine(child.local_transform()), ray, max_distance);
                if (hit && (!best || hit->first < best->first)) {
                    best = hit;
                }
            }
            return best;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);

    if (!result || result->first > max_distance) {
        return std::nullopt;
    }
    return result;
}

std::optional<RaycastHit> raycast_body(const RigidBody& body, const Ray& ray, float max_distance) {
    if (!body.has_collider()) {
        return std::nullopt;
    }

    const Shape& shape = body.collider()->shape;
    if (is_degenerate(shape)) {
        return std::nullopt;
    }

    // Cheap bounds rejection for finite shapes
    if (is_bounded(shape)) {
        const auto bounds_hit = impulse_math::ray_aabb_with_normal(ray, body.world_bounds());
        if (!bounds_hit || bounds_hit->first > max_distance) {
            return std::nullopt;
        }
    }

    const auto hit = raycast_shape(shape, body.collider_transform(), ray, max_distance);
    if (!hit) {
        return std::nullopt;
    }

    RaycastHit result;
    result.body = body.id();
    result.distance = hit->first;
    result.point = ray.at(hit->first);
    result.normal = hit->second;
    result.fraction = max_distance > 0.0f ? hit->first / max_distance : 0.0f;
    return result;
}

} // namespace impulse_physics

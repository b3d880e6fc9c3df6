/// @file collision.cpp
/// @brief Narrow phase contact generation for impulse_physics

#include <impulse/physics/collision.hpp>
#include <impulse/physics/gjk.hpp>

#include <impulse/core/log.hpp>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Transform;

namespace {

/// Below this alignment a face is not used as a clipping reference
constexpr float k_face_alignment = 0.7f;

/// Segments closer than this sine of their angle are treated as parallel
constexpr float k_parallel_sin = 0.05f;

template<typename T>
inline constexpr bool is_convex_shape_v =
    std::is_same_v<T, SphereShape> || std::is_same_v<T, AabbShape> ||
    std::is_same_v<T, BoxShape> || std::is_same_v<T, CapsuleShape> ||
    std::is_same_v<T, ConvexHullShape>;

template<typename T>
inline constexpr bool is_box_shape_v = std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>;

ContactPoint make_point(const Vec3& point_a, const Vec3& point_b, const Vec3& normal) {
    ContactPoint cp;
    cp.point_a = point_a;
    cp.point_b = point_b;
    cp.separation = impulse_math::dot(point_b - point_a, normal);
    return cp;
}

std::optional<ShapeContact> flipped(std::optional<ShapeContact> contact) {
    if (contact) {
        contact->normal = -contact->normal;
        for (auto& p : contact->points) {
            std::swap(p.point_a, p.point_b);
        }
    }
    return contact;
}

/// Transform an AABB shape actually uses (rotation dropped)
Transform axis_aligned(const Transform& t) {
    return Transform{t.position, impulse_math::quat::IDENTITY};
}

std::pair<Vec3, Vec3> capsule_segment(const CapsuleShape& capsule, const Transform& t) {
    const auto [p0, p1] = capsule.endpoints();
    return {t.transform_point(p0), t.transform_point(p1)};
}

Vec3 closest_on_segment(const Vec3& p, const Vec3& a, const Vec3& b) {
    const Vec3 ab = b - a;
    const float len_sq = impulse_math::length_squared(ab);
    if (len_sq < impulse_math::consts::EPSILON) {
        return a;
    }
    const float t = std::clamp(impulse_math::dot(p - a, ab) / len_sq, 0.0f, 1.0f);
    return a + ab * t;
}

/// Closest points between segments p1-q1 and p2-q2
void closest_between_segments(const Vec3& p1, const Vec3& q1, const Vec3& p2, const Vec3& q2,
                              Vec3& c1, Vec3& c2) {
    constexpr float eps = impulse_math::consts::EPSILON;
    const Vec3 d1 = q1 - p1;
    const Vec3 d2 = q2 - p2;
    const Vec3 r = p1 - p2;
    const float a = impulse_math::dot(d1, d1);
    const float e = impulse_math::dot(d2, d2);
    const float f = impulse_math::dot(d2, r);

    float s = 0.0f;
    float t = 0.0f;

    if (a <= eps && e <= eps) {
        s = t = 0.0f;
    } else if (a <= eps) {
        t = std::clamp(f / e, 0.0f, 1.0f);
    } else {
        const float c = impulse_math::dot(d1, r);
        if (e <= eps) {
            s = std::clamp(-c / a, 0.0f, 1.0f);
        } else {
            const float b = impulse_math::dot(d1, d2);
            const float denom = a * e - b * b;
            s = denom > eps ? std::clamp((b * f - c * e) / denom, 0.0f, 1.0f) : 0.0f;
            t = (b * s + f) / e;
            if (t < 0.0f) {
                t = 0.0f;
                s = std::clamp(-c / a, 0.0f, 1.0f);
            } else if (t > 1.0f) {
                t = 1.0f;
                s = std::clamp((b - c) / a, 0.0f, 1.0f);
            }
        }
    }

    c1 = p1 + d1 * s;
    c2 = p2 + d2 * t;
}

// =============================================================================
// Features for clipping
// =============================================================================

/// Surface feature of a shape in a direction: a face polygon, a segment or a point
struct Feature {
    std::vector<Vec3> points;
    Vec3 normal{0.0f, 1.0f, 0.0f};     ///< Outward face normal (the query direction otherwise)

    [[nodiscard]] bool is_face() const noexcept { return points.size() >= 3; }
};

Feature box_face(const Vec3& half_extents, const Transform& t, const Vec3& local_dir) {
    int axis = 0;
    for (int i = 1; i < 3; ++i) {
        if (std::abs(local_dir[i]) > std::abs(local_dir[axis])) {
            axis = i;
        }
    }
    const float sign = local_dir[axis] >= 0.0f ? 1.0f : -1.0f;
    const int j = (axis + 1) % 3;
    const int k = (axis + 2) % 3;

    static constexpr float corner_u[4] = {-1.0f, 1.0f, 1.0f, -1.0f};
    static constexpr float corner_w[4] = {-1.0f, -1.0f, 1.0f, 1.0f};

    Feature feature;
    feature.points.reserve(4);
    for (int c = 0; c < 4; ++c) {
        Vec3 local(0.0f);
        local[axis] = sign * half_extents[axis];
        local[j] = corner_u[c] * half_extents[j];
        local[k] = corner_w[c] * half_extents[k];
        feature.points.push_back(t.transform_point(local));
    }
    Vec3 local_normal(0.0f);
    local_normal[axis] = sign;
    feature.normal = t.transform_vector(local_normal);
    return feature;
}

Feature support_feature(const Shape& shape, const Transform& t, const Vec3& dir) {
    const Vec3 local_dir = t.inverse_transform_vector(dir);

    return std::visit([&](const auto& s) -> Feature {
        using T = std::decay_t<decltype(s)>;
        Feature feature;
        feature.normal = dir;
        if constexpr (std::is_same_v<T, SphereShape>) {
            feature.points.push_back(t.position + dir * s.radius);
        } else if constexpr (is_box_shape_v<T>) {
            feature = box_face(s.half_extents, t, local_dir);
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const auto [p0, p1] = s.endpoints();
            if (std::abs(impulse_math::dot(s.axis_vector(), local_dir)) < k_capsule_parallel_cos) {
                feature.points.push_back(t.transform_point(p0) + dir * s.radius);
                feature.points.push_back(t.transform_point(p1) + dir * s.radius);
            } else {
                feature.points.push_back(t.transform_point(local_support(shape, local_dir)));
            }
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            const HullFace* best = nullptr;
            float best_dot = -2.0f;
            for (const auto& face : s.faces) {
                const float d = impulse_math::dot(face.normal, local_dir);
                if (d > best_dot) {
                    best_dot = d;
                    best = &face;
                }
            }
            if (best) {
                for (std::uint32_t index : best->indices) {
                    feature.points.push_back(t.transform_point(s.vertices[index]));
                }
                feature.normal = t.transform_vector(best->normal);
            }
        } else if constexpr (std::is_same_v<T, PlaneShape> || std::is_same_v<T, CompoundShape>) {
            // Not clipped
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
        return feature;
    }, shape);
}

/// Keep the part of a point set with dot(p - origin, inward) >= 0
std::vector<Vec3> clip_against_plane(const std::vector<Vec3>& input, const Vec3& origin, const Vec3& inward) {
    std::vector<Vec3> output;
    if (input.empty()) {
        return output;
    }

    auto side = [&](const Vec3& p) { return impulse_math::dot(p - origin, inward); };
    auto lerp_cross = [&](const Vec3& a, const Vec3& b, float da, float db) {
        return a + (b - a) * (da / (da - db));
    };

    if (input.size() == 1) {
        if (side(input[0]) >= 0.0f) {
            output.push_back(input[0]);
        }
        return output;
    }

    if (input.size() == 2) {
        const float d0 = side(input[0]);
        const float d1 = side(input[1]);
        if (d0 >= 0.0f && d1 >= 0.0f) {
            return input;
        }
        if (d0 < 0.0f && d1 < 0.0f) {
            return output;
        }
        const Vec3 crossing = lerp_cross(input[0], input[1], d0, d1);
        output.push_back(d0 >= 0.0f ? input[0] : crossing);
        output.push_back(d1 >= 0.0f ? input[1] : crossing);
        return output;
    }

    // Sutherland-Hodgman
    for (std::size_t i = 0; i < input.size(); ++i) {
        const Vec3& current = input[i];
        const Vec3& next = input[(i + 1) % input.size()];
        const float dc = side(current);
        const float dn = side(next);

        if (dc >= 0.0f) {
            output.push_back(current);
        }
        if ((dc >= 0.0f) != (dn >= 0.0f)) {
            output.push_back(lerp_cross(current, next, dc, dn));
        }
    }
    return output;
}

} // anonymous namespace

// =============================================================================
// Closed-form Tests
// =============================================================================

std::optional<ShapeContact> collide_sphere_sphere(const Vec3& center_a, float radius_a,
                                                  const Vec3& center_b, float radius_b,
                                                  float margin) {
    const Vec3 diff = center_b - center_a;
    const float dist_sq = impulse_math::dot(diff, diff);
    const float reach = radius_a + radius_b + margin;

    if (dist_sq > reach * reach) {
        return std::nullopt;
    }

    const float dist = std::sqrt(dist_sq);

    ShapeContact contact;
    // Centers coincide - pick arbitrary normal
    contact.normal = dist > k_collision_epsilon ? diff / dist : impulse_math::vec3::Y;
    contact.points.push_back(make_point(center_a + contact.normal * radius_a,
                                        center_b - contact.normal * radius_b,
                                        contact.normal));
    return contact;
}

std::optional<ShapeContact> collide_sphere_capsule(const Vec3& center, float radius,
                                                   const Vec3& seg_a, const Vec3& seg_b, float capsule_radius,
                                                   float margin) {
    const Vec3 closest = closest_on_segment(center, seg_a, seg_b);
    const Vec3 diff = closest - center;
    const float dist_sq = impulse_math::dot(diff, diff);
    const float reach = radius + capsule_radius + margin;

    if (dist_sq > reach * reach) {
        return std::nullopt;
    }

    const float dist = std::sqrt(dist_sq);

    ShapeContact contact;
    if (dist > k_collision_epsilon) {
        contact.normal = diff / dist;
    } else {
        // Center on the axis: push out sideways
        contact.normal = impulse_math::any_perpendicular(
            impulse_math::normalize_or(seg_b - seg_a, impulse_math::vec3::Y));
    }
    contact.points.push_back(make_point(center + contact.normal * radius,
                                        closest - contact.normal * capsule_radius,
                                        contact.normal));
    return contact;
}

std::optional<ShapeContact> collide_capsule_capsule(const Vec3& a0, const Vec3& a1, float radius_a,
                                                    const Vec3& b0, const Vec3& b1, float radius_b,
                                                    float margin) {
    Vec3 ca;
    Vec3 cb;
    closest_between_segments(a0, a1, b0, b1, ca, cb);

    const Vec3 diff = cb - ca;
    const float dist = impulse_math::length(diff);
    if (dist > radius_a + radius_b + margin) {
        return std::nullopt;
    }

    const Vec3 da = a1 - a0;
    const Vec3 db = b1 - b0;
    const Vec3 axis_a = impulse_math::normalize_or(da, impulse_math::vec3::Y);

    ShapeContact contact;
    if (dist > k_collision_epsilon) {
        contact.normal = diff / dist;
    } else {
        contact.normal = impulse_math::normalize_or(impulse_math::cross(da, db),
                                                    impulse_math::any_perpendicular(axis_a));
    }

    // Axis point pairs before inflating by the radii
    std::vector<std::pair<Vec3, Vec3>> pairs;
    pairs.emplace_back(ca, cb);

    const float len_a = impulse_math::length_squared(da);
    const float len_b = impulse_math::length_squared(db);
    const bool parallel = len_a > impulse_math::consts::EPSILON && len_b > impulse_math::consts::EPSILON &&
        impulse_math::length(impulse_math::cross(axis_a, impulse_math::normalize(db))) < k_parallel_sin;

    if (parallel) {
        for (const Vec3& end : {b0, b1}) {
            const float t = impulse_math::dot(end - a0, da) / len_a;
            if (t >= 0.0f && t <= 1.0f) {
                pairs.emplace_back(a0 + da * t, end);
            }
        }
        for (const Vec3& end : {a0, a1}) {
            const float t = impulse_math::dot(end - b0, db) / len_b;
            if (t >= 0.0f && t <= 1.0f) {
                pairs.emplace_back(end, b0 + db * t);
            }
        }

        // Keep the two extremes of the overlap along A
        auto along = [&](const std::pair<Vec3, Vec3>& p) { return impulse_math::dot(p.first - a0, axis_a); };
        const auto [lo, hi] = std::minmax_element(pairs.begin(), pairs.end(),
            [&](const auto& x, const auto& y) { return along(x) < along(y); });
        std::vector<std::pair<Vec3, Vec3>> extremes{*lo};
        if (along(*hi) - along(*lo) > 1e-3f) {
            extremes.push_back(*hi);
        }
        pairs = std::move(extremes);
    }

    for (const auto& [pa, pb] : pairs) {
        ContactPoint cp = make_point(pa + contact.normal * radius_a, pb - contact.normal * radius_b, contact.normal);
        if (cp.separation <= margin) {
            contact.points.push_back(cp);
        }
    }

    if (contact.points.empty()) {
        return std::nullopt;
    }
    return contact;
}

std::optional<ShapeContact> collide_sphere_box(const Vec3& center, float radius,
                                               const Transform& box, const Vec3& half_extents,
                                               float margin) {
    const Vec3 local = box.inverse_transform_point(center);
    const Vec3 clamped = impulse_math::max(-half_extents, impulse_math::min(local, half_extents));
    const Vec3 delta = clamped - local;
    const float dist_sq = impulse_math::dot(delta, delta);

    ShapeContact contact;
    Vec3 surface_local = clamped;

    if (dist_sq > k_collision_epsilon * k_collision_epsilon) {
        // Center outside the box
        const float dist = std::sqrt(dist_sq);
        if (dist > radius + margin) {
            return std::nullopt;
        }
        contact.normal = box.transform_vector(delta / dist);
    } else {
        // Center inside: leave through the nearest face
        int axis = 0;
        float best = half_extents[0] - std::abs(local[0]);
        for (int i = 1; i < 3; ++i) {
            const float d = half_extents[i] - std::abs(local[i]);
            if (d < best) {
                best = d;
                axis = i;
            }
        }
        const float sign = local[axis] >= 0.0f ? 1.0f : -1.0f;
        surface_local[axis] = sign * half_extents[axis];
        Vec3 outward(0.0f);
        outward[axis] = sign;
        contact.normal = -box.transform_vector(outward);
    }

    contact.points.push_back(make_point(center + contact.normal * radius,
                                        box.transform_point(surface_local),
                                        contact.normal));
    return contact;
}

std::optional<ShapeContact> collide_convex_plane(const Shape& shape, const Transform& shape_transform,
                                                 const PlaneShape& plane, const Transform& plane_transform,
                                                 float margin) {
    const Vec3 plane_normal = plane_transform.transform_vector(plane.normal);
    const float plane_offset = plane.offset + impulse_math::dot(plane_normal, plane_transform.position);

    // Candidate deepest points of the shape
    std::vector<Vec3> candidates;
    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            candidates.push_back(shape_transform.position - plane_normal * s.radius);
        } else if constexpr (is_box_shape_v<T>) {
            const Transform t = std::is_same_v<T, AabbShape> ? axis_aligned(shape_transform) : shape_transform;
            for (const auto& corner : impulse_math::AABB(-s.half_extents, s.half_extents).corners()) {
                candidates.push_back(t.transform_point(corner));
            }
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const auto [p0, p1] = capsule_segment(s, shape_transform);
            candidates.push_back(p0 - plane_normal * s.radius);
            candidates.push_back(p1 - plane_normal * s.radius);
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            for (const auto& v : s.vertices) {
                candidates.push_back(shape_transform.transform_point(v));
            }
        } else if constexpr (std::is_same_v<T, PlaneShape> || std::is_same_v<T, CompoundShape>) {
            // Planes never touch planes; compounds are split by the caller
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);

    ShapeContact contact;
    contact.normal = -plane_normal;  // Points from the shape into the plane solid

    for (const Vec3& p : candidates) {
        const float dist = impulse_math::dot(plane_normal, p) - plane_offset;
        if (dist <= margin) {
            contact.points.push_back(make_point(p, p - plane_normal * dist, contact.normal));
        }
    }

    if (contact.points.empty()) {
        return std::nullopt;
    }
    reduce_manifold(contact.points, contact.normal);
    return contact;
}

std::optional<ShapeContact> collide_convex(const Shape& a, const Transform& ta,
                                           const Shape& b, const Transform& tb,
                                           float margin) {
    const ShapeProxy proxy_a = ShapeProxy::make(a, ta);
    const ShapeProxy proxy_b = ShapeProxy::make(b, tb);

    Vec3 n(0.0f);
    ContactPoint nearest;
    if (const auto penetration = gjk_epa(proxy_a, proxy_b)) {
        n = penetration->normal;
        nearest.point_a = penetration->point_a;
        nearest.point_b = penetration->point_b;
        nearest.separation = -penetration->depth;
    } else {
        // Disjoint: a speculative contact when the gap is inside the margin
        if (margin <= 0.0f) {
            return std::nullopt;
        }
        const auto separation = gjk_distance(proxy_a, proxy_b);
        if (!separation || separation->distance > margin) {
            return std::nullopt;
        }
        n = separation->normal;
        nearest.point_a = separation->point_a;
        nearest.point_b = separation->point_b;
        nearest.separation = separation->distance;
    }

    ShapeContact contact;

    const Feature feature_a = support_feature(a, proxy_a.transform, n);
    const Feature feature_b = support_feature(b, proxy_b.transform, -n);
    const float align_a = feature_a.is_face() ? impulse_math::dot(feature_a.normal, n) : -1.0f;
    const float align_b = feature_b.is_face() ? impulse_math::dot(feature_b.normal, -n) : -1.0f;

    if (std::max(align_a, align_b) >= k_face_alignment) {
        const bool reference_is_a = align_a >= align_b;
        const Feature& reference = reference_is_a ? feature_a : feature_b;
        const Feature& incident = reference_is_a ? feature_b : feature_a;
        const Vec3 ref_normal = reference.normal;

        Vec3 centroid(0.0f);
        for (const Vec3& p : reference.points) {
            centroid += p;
        }
        centroid /= static_cast<float>(reference.points.size());

        // Clip the incident feature by the side planes of the reference face
        std::vector<Vec3> clipped = incident.points;
        for (std::size_t i = 0; i < reference.points.size() && !clipped.empty(); ++i) {
            const Vec3& v0 = reference.points[i];
            const Vec3& v1 = reference.points[(i + 1) % reference.points.size()];
            Vec3 inward = impulse_math::cross(ref_normal, v1 - v0);
            if (impulse_math::dot(inward, centroid - v0) < 0.0f) {
                inward = -inward;
            }
            clipped = clip_against_plane(clipped, v0, inward);
        }

        contact.normal = reference_is_a ? ref_normal : -ref_normal;
        for (const Vec3& p : clipped) {
            const float depth = impulse_math::dot(p - reference.points[0], ref_normal);
            if (depth > margin) {
                continue;
            }
            const Vec3 on_reference = p - ref_normal * depth;
            contact.points.push_back(reference_is_a
                ? make_point(on_reference, p, contact.normal)
                : make_point(p, on_reference, contact.normal));
        }
        reduce_manifold(contact.points, contact.normal);
    }

    if (contact.points.empty()) {
        contact.normal = n;
        contact.points.push_back(nearest);
    }

    return contact;
}

// =============================================================================
// Dispatch
// =============================================================================

std::optional<ShapeContact> collide_shapes(const Shape& a, const Transform& ta,
                                           const Shape& b, const Transform& tb,
                                           float margin) {
    return std::visit([&](const auto& sa, const auto& sb) -> std::optional<ShapeContact> {
        using A = std::decay_t<decltype(sa)>;
        using B = std::decay_t<decltype(sb)>;

        if constexpr (std::is_same_v<A, CompoundShape> || std::is_same_v<B, CompoundShape>) {
            // Split by collide()
            return std::nullopt;
        } else if constexpr (std::is_same_v<A, PlaneShape> && std::is_same_v<B, PlaneShape>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<B, PlaneShape>) {
            return collide_convex_plane(a, ta, sb, tb, margin);
        } else if constexpr (std::is_same_v<A, PlaneShape>) {
            return flipped(collide_convex_plane(b, tb, sa, ta, margin));
        } else if constexpr (std::is_same_v<A, SphereShape> && std::is_same_v<B, SphereShape>) {
            return collide_sphere_sphere(ta.position, sa.radius, tb.position, sb.radius, margin);
        } else if constexpr (std::is_same_v<A, SphereShape> && std::is_same_v<B, CapsuleShape>) {
            const auto [p0, p1] = capsule_segment(sb, tb);
            return collide_sphere_capsule(ta.position, sa.radius, p0, p1, sb.radius, margin);
        } else if constexpr (std::is_same_v<A, CapsuleShape> && std::is_same_v<B, SphereShape>) {
            const auto [p0, p1] = capsule_segment(sa, ta);
            return flipped(collide_sphere_capsule(tb.position, sb.radius, p0, p1, sa.radius, margin));
        } else if constexpr (std::is_same_v<A, CapsuleShape> && std::is_same_v<B, CapsuleShape>) {
            const auto [a0, a1] = capsule_segment(sa, ta);
            const auto [b0, b1] = capsule_segment(sb, tb);
            return collide_capsule_capsule(a0, a1, sa.radius, b0, b1, sb.radius, margin);
        } else if constexpr (std::is_same_v<A, SphereShape> && is_box_shape_v<B>) {
            const Transform box = std::is_same_v<B, AabbShape> ? axis_aligned(tb) : tb;
            return collide_sphere_box(ta.position, sa.radius, box, sb.half_extents, margin);
        } else if constexpr (is_box_shape_v<A> && std::is_same_v<B, SphereShape>) {
            const Transform box = std::is_same_v<A, AabbShape> ? axis_aligned(ta) : ta;
            return flipped(collide_sphere_box(tb.position, sb.radius, box, sa.half_extents, margin));
        } else if constexpr (is_convex_shape_v<A> && is_convex_shape_v<B>) {
            return collide_convex(a, ta, b, tb, margin);
        } else {
            static_assert(detail::always_false_v<A>, "unhandled shape pair");
        }
    }, a, b);
}

namespace {

/// Leaf of a possibly compound collider
struct ShapeLeaf {
    const Shape* shape = nullptr;
    Transform transform;
    int index = -1;     ///< Leaf index within the compound, -1 for a simple collider
};

void flatten(const Shape& shape, const Transform& transform, std::vector<ShapeLeaf>& leaves, bool in_compound) {
    if (const auto* compound = std::get_if<CompoundShape>(&shape)) {
        for (const auto& child : compound->children) {
            flatten(child.shape, transform.combine(child.local_transform()), leaves, true);
        }
        return;
    }
    const int index = in_compound ? static_cast<int>(leaves.size()) : -1;
    leaves.push_back(ShapeLeaf{&shape, transform, index});
}

} // anonymous namespace

void collide(const Shape& a, const Transform& ta,
             const Shape& b, const Transform& tb,
             std::vector<ShapeContact>& out,
             float margin) {
    if (is_degenerate(a) || is_degenerate(b)) {
        IMPULSE_LOG_WARN("Narrowphase skipped degenerate {} / {} pair",
                         to_string(shape_type(a)), to_string(shape_type(b)));
        return;
    }

    const bool compound = std::holds_alternative<CompoundShape>(a) || std::holds_alternative<CompoundShape>(b);
    if (!compound) {
        if (auto contact = collide_shapes(a, ta, b, tb, margin)) {
            out.push_back(std::move(*contact));
        }
        return;
    }

    std::vector<ShapeLeaf> leaves_a;
    std::vector<ShapeLeaf> leaves_b;
    flatten(a, ta, leaves_a, false);
    flatten(b, tb, leaves_b, false);

    for (const auto& leaf_a : leaves_a) {
        const impulse_math::AABB bounds_a = world_bounds(*leaf_a.shape, leaf_a.transform).expanded(margin);
        for (const auto& leaf_b : leaves_b) {
            if (!bounds_a.intersects(world_bounds(*leaf_b.shape, leaf_b.transform))) {
                continue;
            }
            if (auto contact = collide_shapes(*leaf_a.shape, leaf_a.transform,
                                              *leaf_b.shape, leaf_b.transform, margin)) {
                contact->feature_id = make_feature_id(leaf_a.index, leaf_b.index);
                out.push_back(std::move(*contact));
            }
        }
    }
}

} // namespace impulse_physics

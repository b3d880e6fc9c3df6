/// @file gjk.cpp
/// @brief GJK and EPA implementation for impulse_physics

#include <impulse/physics/gjk.hpp>

#include <cmath>
#include <limits>
#include <tuple>
#include <utility>
#include <vector>

namespace impulse_physics {

using impulse_math::Vec3;

// =============================================================================
// ShapeProxy Implementation
// =============================================================================

ShapeProxy ShapeProxy::make(const Shape& shape, const impulse_math::Transform& transform) {
    ShapeProxy proxy;
    proxy.shape = &shape;
    proxy.transform = transform;
    if (std::holds_alternative<AabbShape>(shape)) {
        proxy.transform.rotation = impulse_math::quat::IDENTITY;
    }
    return proxy;
}

Vec3 ShapeProxy::support(const Vec3& direction) const {
    const Vec3 local_dir = transform.inverse_transform_vector(direction);
    return transform.transform_point(local_support(*shape, local_dir));
}

// =============================================================================
// GJK
// =============================================================================

namespace {

bool same_direction(const Vec3& a, const Vec3& b) {
    return impulse_math::dot(a, b) > 0.0f;
}

/// Line simplex
bool do_simplex_line(Simplex& simplex, Vec3& direction) {
    const SupportPoint a = simplex[0];
    const SupportPoint b = simplex[1];
    const Vec3 ab = b.point - a.point;
    const Vec3 ao = -a.point;

    if (same_direction(ab, ao)) {
        // Origin is between a and b
        direction = impulse_math::cross(impulse_math::cross(ab, ao), ab);
    } else {
        // Origin is beyond a
        simplex.assign({a});
        direction = ao;
    }
    return false;
}

/// Triangle simplex
bool do_simplex_triangle(Simplex& simplex, Vec3& direction) {
    const SupportPoint a = simplex[0];
    const SupportPoint b = simplex[1];
    const SupportPoint c = simplex[2];

    const Vec3 ab = b.point - a.point;
    const Vec3 ac = c.point - a.point;
    const Vec3 ao = -a.point;
    const Vec3 abc = impulse_math::cross(ab, ac);

    if (same_direction(impulse_math::cross(abc, ac), ao)) {
        if (same_direction(ac, ao)) {
            simplex.assign({a, c});
            direction = impulse_math::cross(impulse_math::cross(ac, ao), ac);
            return false;
        }
        simplex.assign({a, b});
        return do_simplex_line(simplex, direction);
    }

    if (same_direction(impulse_math::cross(ab, abc), ao)) {
        simplex.assign({a, b});
        return do_simplex_line(simplex, direction);
    }

    // Origin is above or below the triangle
    if (same_direction(abc, ao)) {
        direction = abc;
    } else {
        simplex.assign({a, c, b});
        direction = -abc;
    }
    return false;
}

/// Tetrahedron simplex
bool do_simplex_tetrahedron(Simplex& simplex, Vec3& direction) {
    const SupportPoint a = simplex[0];
    const SupportPoint b = simplex[1];
    const SupportPoint c = simplex[2];
    const SupportPoint d = simplex[3];

    const Vec3 ab = b.point - a.point;
    const Vec3 ac = c.point - a.point;
    const Vec3 ad = d.point - a.point;
    const Vec3 ao = -a.point;

    const Vec3 abc = impulse_math::cross(ab, ac);
    const Vec3 acd = impulse_math::cross(ac, ad);
    const Vec3 adb = impulse_math::cross(ad, ab);

    // Check each face
    if (same_direction(abc, ao)) {
        simplex.assign({a, b, c});
        return do_simplex_triangle(simplex, direction);
    }
    if (same_direction(acd, ao)) {
        simplex.assign({a, c, d});
        return do_simplex_triangle(simplex, direction);
    }
    if (same_direction(adb, ao)) {
        simplex.assign({a, d, b});
        return do_simplex_triangle(simplex, direction);
    }

    // Origin is inside tetrahedron
    return true;
}

/// Process simplex and update search direction
/// Returns true if simplex contains origin
bool do_simplex(Simplex& simplex, Vec3& direction) {
    switch (simplex.size()) {
        case 2: return do_simplex_line(simplex, direction);
        case 3: return do_simplex_triangle(simplex, direction);
        case 4: return do_simplex_tetrahedron(simplex, direction);
        default: return false;
    }
}

} // anonymous namespace

SupportPoint minkowski_support(const ShapeProxy& a, const ShapeProxy& b, const Vec3& direction) {
    SupportPoint sp;
    sp.support_a = a.support(direction);
    sp.support_b = b.support(-direction);
    sp.point = sp.support_a - sp.support_b;
    return sp;
}

GjkResult gjk(const ShapeProxy& a, const ShapeProxy& b) {
    GjkResult result;
    result.direction = impulse_math::normalize_or(a.center() - b.center(), impulse_math::vec3::X);

    // Get initial support point
    SupportPoint support = minkowski_support(a, b, result.direction);
    result.simplex.push_front(support);

    // Search toward origin
    result.direction = -support.point;

    for (int i = 0; i < k_max_gjk_iterations; ++i) {
        result.iterations = i + 1;

        const float dir_len = impulse_math::length(result.direction);
        if (dir_len < k_collision_epsilon) {
            // Origin on simplex: touching counts as intersecting
            result.intersecting = true;
            return result;
        }
        result.direction = result.direction / dir_len;

        support = minkowski_support(a, b, result.direction);

        // Check if we passed the origin
        if (impulse_math::dot(support.point, result.direction) <= 0.0f) {
            result.intersecting = false;
            return result;
        }

        result.simplex.push_front(support);

        if (do_simplex(result.simplex, result.direction)) {
            result.intersecting = true;
            return result;
        }
    }

    // Didn't converge - assume no intersection
    result.intersecting = false;
    return result;
}

// =============================================================================
// GJK Distance
// =============================================================================

namespace {

/// Sub-simplex nearest the origin with the barycentric weights of that point
struct NearestFeature {
    Simplex simplex;
    std::array<float, 4> weights{};
    bool encloses_origin = false;

    [[nodiscard]] Vec3 point() const {
        Vec3 p(0.0f);
        for (int i = 0; i < simplex.size(); ++i) {
            p += simplex[i].point * weights[static_cast<std::size_t>(i)];
        }
        return p;
    }
};

NearestFeature nearest_vertex(const SupportPoint& a) {
    NearestFeature f;
    f.simplex.assign({a});
    f.weights[0] = 1.0f;
    return f;
}

NearestFeature nearest_on_edge(const SupportPoint& a, const SupportPoint& b) {
    const Vec3 ab = b.point - a.point;
    const float len_sq = impulse_math::length_squared(ab);
    if (len_sq < k_collision_epsilon * k_collision_epsilon) {
        return nearest_vertex(a);
    }
    const float t = impulse_math::dot(-a.point, ab) / len_sq;
    if (t <= 0.0f) {
        return nearest_vertex(a);
    }
    if (t >= 1.0f) {
        return nearest_vertex(b);
    }
    NearestFeature f;
    f.simplex.assign({a, b});
    f.weights[0] = 1.0f - t;
    f.weights[1] = t;
    return f;
}

NearestFeature nearest_of(NearestFeature x, NearestFeature y) {
    return impulse_math::length_squared(y.point()) < impulse_math::length_squared(x.point()) ? y : x;
}

/// Voronoi region walk of the triangle around the origin
NearestFeature nearest_on_triangle(const SupportPoint& a, const SupportPoint& b, const SupportPoint& c) {
    const Vec3 ab = b.point - a.point;
    const Vec3 ac = c.point - a.point;

    const float d1 = impulse_math::dot(ab, -a.point);
    const float d2 = impulse_math::dot(ac, -a.point);
    if (d1 <= 0.0f && d2 <= 0.0f) {
        return nearest_vertex(a);
    }

    const float d3 = impulse_math::dot(ab, -b.point);
    const float d4 = impulse_math::dot(ac, -b.point);
    if (d3 >= 0.0f && d4 <= d3) {
        return nearest_vertex(b);
    }

    const float vc = d1 * d4 - d3 * d2;
    if (vc <= 0.0f && d1 >= 0.0f && d3 <= 0.0f) {
        return nearest_on_edge(a, b);
    }

    const float d5 = impulse_math::dot(ab, -c.point);
    const float d6 = impulse_math::dot(ac, -c.point);
    if (d6 >= 0.0f && d5 <= d6) {
        return nearest_vertex(c);
    }

    const float vb = d5 * d2 - d1 * d6;
    if (vb <= 0.0f && d2 >= 0.0f && d6 <= 0.0f) {
        return nearest_on_edge(a, c);
    }

    const float va = d3 * d6 - d5 * d4;
    if (va <= 0.0f && (d4 - d3) >= 0.0f && (d5 - d6) >= 0.0f) {
        return nearest_on_edge(b, c);
    }

    const float sum = va + vb + vc;
    if (sum < k_collision_epsilon * k_collision_epsilon) {
        // Collinear vertices
        return nearest_of(nearest_of(nearest_on_edge(a, b), nearest_on_edge(a, c)), nearest_on_edge(b, c));
    }

    NearestFeature f;
    f.simplex.assign({a, b, c});
    f.weights[1] = vb / sum;
    f.weights[2] = vc / sum;
    f.weights[0] = 1.0f - f.weights[1] - f.weights[2];
    return f;
}

NearestFeature nearest_on_tetrahedron(const SupportPoint& a, const SupportPoint& b,
                                      const SupportPoint& c, const SupportPoint& d) {
    struct Face { const SupportPoint* p; const SupportPoint* q; const SupportPoint* r; const SupportPoint* opposite; };
    const Face faces[4] = {{&a, &b, &c, &d}, {&a, &c, &d, &b}, {&a, &d, &b, &c}, {&b, &d, &c, &a}};

    bool outside_any = false;
    NearestFeature best;
    for (const Face& face : faces) {
        const Vec3 n = impulse_math::cross(face.q->point - face.p->point, face.r->point - face.p->point);
        const float origin_side = impulse_math::dot(n, -face.p->point);
        const float opposite_side = impulse_math::dot(n, face.opposite->point - face.p->point);
        const bool flat = std::abs(opposite_side) < k_collision_epsilon * k_collision_epsilon;
        if (!flat && origin_side * opposite_side >= 0.0f) {
            continue;
        }
        const NearestFeature candidate = nearest_on_triangle(*face.p, *face.q, *face.r);
        best = outside_any ? nearest_of(best, candidate) : candidate;
        outside_any = true;
    }

    if (!outside_any) {
        NearestFeature inside;
        inside.simplex.assign({a, b, c, d});
        inside.encloses_origin = true;
        return inside;
    }
    return best;
}

NearestFeature nearest_with(const NearestFeature& current, const SupportPoint& w) {
    const Simplex& s = current.simplex;
    switch (s.size()) {
        case 1: return nearest_on_edge(w, s[0]);
        case 2: return nearest_on_triangle(w, s[0], s[1]);
        default: return nearest_on_tetrahedron(w, s[0], s[1], s[2]);
    }
}

Separation separation_from(const NearestFeature& f) {
    Separation result;
    for (int i = 0; i < f.simplex.size(); ++i) {
        const float weight = f.weights[static_cast<std::size_t>(i)];
        result.point_a += f.simplex[i].support_a * weight;
        result.point_b += f.simplex[i].support_b * weight;
    }
    const Vec3 gap = result.point_b - result.point_a;
    result.distance = impulse_math::length(gap);
    result.normal = impulse_math::normalize_or(gap, impulse_math::vec3::X);
    return result;
}

} // anonymous namespace

std::optional<Separation> gjk_distance(const ShapeProxy& a, const ShapeProxy& b) {
    const Vec3 initial = impulse_math::normalize_or(b.center() - a.center(), impulse_math::vec3::X);
    NearestFeature nearest = nearest_vertex(minkowski_support(a, b, -initial));
    Vec3 v = nearest.point();

    for (int i = 0; i < k_max_gjk_iterations; ++i) {
        const float dist_sq = impulse_math::length_squared(v);
        if (dist_sq < k_collision_epsilon * k_collision_epsilon) {
            return std::nullopt;
        }

        const SupportPoint w = minkowski_support(a, b, -v);

        // No support point gets meaningfully closer: v is the nearest point
        if (dist_sq - impulse_math::dot(v, w.point) <= k_gjk_distance_tolerance * dist_sq) {
            return separation_from(nearest);
        }
        for (int k = 0; k < nearest.simplex.size(); ++k) {
            if (impulse_math::length_squared(nearest.simplex[k].point - w.point) < k_collision_epsilon) {
                return separation_from(nearest);
            }
        }

        NearestFeature next = nearest_with(nearest, w);
        if (next.encloses_origin) {
            return std::nullopt;
        }
        const Vec3 next_v = next.point();
        if (impulse_math::length_squared(next_v) >= dist_sq) {
            return separation_from(nearest);
        }
        nearest = next;
        v = next_v;
    }

    // Not converged; the caller treats this like an overlap
    return std::nullopt;
}

// =============================================================================
// EPA
// =============================================================================

namespace {

/// EPA polytope face
struct EpaFace {
    std::array<int, 3> indices{};   ///< Vertex indices
    Vec3 normal{0.0f};              ///< Outward face normal
    float distance = 0.0f;          ///< Distance from origin
    bool valid = false;
};

/// Create EPA face oriented away from an interior point
EpaFace make_face(const std::vector<SupportPoint>& vertices, int i, int j, int k, const Vec3& interior) {
    EpaFace face;
    face.indices = {i, j, k};

    const Vec3& a = vertices[i].point;
    const Vec3 n = impulse_math::cross(vertices[j].point - a, vertices[k].point - a);
    const float len = impulse_math::length(n);
    if (len < k_collision_epsilon * k_collision_epsilon) {
        return face;
    }

    face.normal = n / len;
    if (impulse_math::dot(face.normal, a - interior) < 0.0f) {
        std::swap(face.indices[1], face.indices[2]);
        face.normal = -face.normal;
    }
    face.distance = impulse_math::dot(face.normal, a);
    face.valid = true;
    return face;
}

/// Add edge to horizon, removing if already present (silhouette)
void add_edge(std::vector<std::pair<int, int>>& horizon, int a, int b) {
    for (auto it = horizon.begin(); it != horizon.end(); ++it) {
        if (it->first == b && it->second == a) {
            horizon.erase(it);
            return;
        }
    }
    horizon.emplace_back(a, b);
}

/// Compute barycentric coordinates
std::tuple<float, float, float> barycentric(const Vec3& p, const Vec3& a, const Vec3& b, const Vec3& c) {
    const Vec3 v0 = b - a;
    const Vec3 v1 = c - a;
    const Vec3 v2 = p - a;

    const float d00 = impulse_math::dot(v0, v0);
    const float d01 = impulse_math::dot(v0, v1);
    const float d11 = impulse_math::dot(v1, v1);
    const float d20 = impulse_math::dot(v2, v0);
    const float d21 = impulse_math::dot(v2, v1);

    const float denom = d00 * d11 - d01 * d01;
    if (std::abs(denom) < k_collision_epsilon * k_collision_epsilon) {
        return {1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 3.0f};
    }

    const float v = (d11 * d20 - d01 * d21) / denom;
    const float w = (d00 * d21 - d01 * d20) / denom;
    return {1.0f - v - w, v, w};
}

float distance_to_line(const Vec3& p, const Vec3& a, const Vec3& b) {
    const Vec3 ab = b - a;
    const float len_sq = impulse_math::length_squared(ab);
    if (len_sq < k_collision_epsilon) {
        return impulse_math::length(p - a);
    }
    const float t = impulse_math::dot(p - a, ab) / len_sq;
    return impulse_math::length(p - (a + ab * t));
}

/// Grow a degenerate GJK simplex into a tetrahedron enclosing the origin region
bool blow_up_simplex(const ShapeProxy& a, const ShapeProxy& b, std::vector<SupportPoint>& vertices) {
    constexpr float min_gap = 1e-5f;

    if (vertices.size() == 1) {
        static const std::array<Vec3, 6> axes = {
            impulse_math::vec3::X, impulse_math::vec3::NEG_X,
            impulse_math::vec3::Y, impulse_math::vec3::NEG_Y,
            impulse_math::vec3::Z, impulse_math::vec3::NEG_Z,
        };
        for (const auto& axis : axes) {
            SupportPoint sp = minkowski_support(a, b, axis);
            if (impulse_math::length(sp.point - vertices[0].point) > min_gap) {
                vertices.push_back(sp);
                break;
            }
        }
        if (vertices.size() < 2) return false;
    }

    if (vertices.size() == 2) {
        const Vec3 line = impulse_math::normalize_or_zero(vertices[1].point - vertices[0].point);
        if (impulse_math::length_squared(line) < 0.5f) return false;
        const Vec3 perp = impulse_math::any_perpendicular(line);
        for (int k = 0; k < 6; ++k) {
            const impulse_math::Quat spin = impulse_math::quat_from_axis_angle(line, impulse_math::consts::PI / 3.0f * static_cast<float>(k));
            SupportPoint sp = minkowski_support(a, b, spin * perp);
            if (distance_to_line(sp.point, vertices[0].point, vertices[1].point) > min_gap) {
                vertices.push_back(sp);
                break;
            }
        }
        if (vertices.size() < 3) return false;
    }

    if (vertices.size() == 3) {
        const Vec3 n = impulse_math::normalize_or_zero(impulse_math::cross(
            vertices[1].point - vertices[0].point, vertices[2].point - vertices[0].point));
        if (impulse_math::length_squared(n) < 0.5f) return false;
        SupportPoint sp = minkowski_support(a, b, n);
        if (std::abs(impulse_math::dot(sp.point - vertices[0].point, n)) <= min_gap) {
            sp = minkowski_support(a, b, -n);
        }
        if (std::abs(impulse_math::dot(sp.point - vertices[0].point, n)) <= min_gap) return false;
        vertices.push_back(sp);
    }

    const float volume = impulse_math::dot(vertices[1].point - vertices[0].point,
        impulse_math::cross(vertices[2].point - vertices[0].point, vertices[3].point - vertices[0].point));
    return std::abs(volume) > min_gap * min_gap * min_gap;
}

Penetration penetration_from_face(const std::vector<SupportPoint>& vertices, const EpaFace& face) {
    Penetration result;
    result.normal = face.normal;
    result.depth = std::max(face.distance, 0.0f);

    const SupportPoint& v0 = vertices[face.indices[0]];
    const SupportPoint& v1 = vertices[face.indices[1]];
    const SupportPoint& v2 = vertices[face.indices[2]];

    // Project origin onto face to get barycentric coordinates
    const Vec3 closest = face.normal * face.distance;
    const auto [u, v, w] = barycentric(closest, v0.point, v1.point, v2.point);

    result.point_a = v0.support_a * u + v1.support_a * v + v2.support_a * w;
    result.point_b = v0.support_b * u + v1.support_b * v + v2.support_b * w;
    return result;
}

} // anonymous namespace

std::optional<Penetration> epa(const ShapeProxy& a, const ShapeProxy& b, const Simplex& simplex) {
    std::vector<SupportPoint> vertices;
    vertices.reserve(k_max_epa_iterations + 4);
    for (int i = 0; i < simplex.size(); ++i) {
        vertices.push_back(simplex[i]);
    }
    if (vertices.empty() || !blow_up_simplex(a, b, vertices)) {
        return std::nullopt;
    }

    // The initial centroid stays inside the growing polytope
    const Vec3 interior = (vertices[0].point + vertices[1].point + vertices[2].point + vertices[3].point) * 0.25f;

    std::vector<EpaFace> faces;
    for (const auto& f : {std::array<int, 3>{0, 1, 2}, std::array<int, 3>{0, 3, 1},
                          std::array<int, 3>{0, 2, 3}, std::array<int, 3>{1, 3, 2}}) {
        EpaFace face = make_face(vertices, f[0], f[1], f[2], interior);
        if (!face.valid) {
            return std::nullopt;
        }
        faces.push_back(face);
    }

    auto closest_face = [&faces]() {
        std::size_t best = 0;
        for (std::size_t i = 1; i < faces.size(); ++i) {
            if (faces[i].distance < faces[best].distance) {
                best = i;
            }
        }
        return best;
    };

    for (int iter = 0; iter < k_max_epa_iterations; ++iter) {
        const EpaFace face = faces[closest_face()];

        SupportPoint support = minkowski_support(a, b, face.normal);
        const float support_dist = impulse_math::dot(support.point, face.normal);
        if (support_dist - face.distance < k_epa_tolerance) {
            return penetration_from_face(vertices, face);
        }

        const int new_vertex = static_cast<int>(vertices.size());
        vertices.push_back(support);

        // Remove faces visible from new point
        std::vector<std::pair<int, int>> horizon;
        std::vector<EpaFace> remaining;
        remaining.reserve(faces.size());
        for (const auto& f : faces) {
            const Vec3 to_point = support.point - vertices[f.indices[0]].point;
            if (impulse_math::dot(f.normal, to_point) > k_collision_epsilon) {
                add_edge(horizon, f.indices[0], f.indices[1]);
                add_edge(horizon, f.indices[1], f.indices[2]);
                add_edge(horizon, f.indices[2], f.indices[0]);
            } else {
                remaining.push_back(f);
            }
        }

        if (horizon.empty()) {
            // No visible face: numerically converged
            return penetration_from_face(vertices, face);
        }

        // Create new faces from horizon edges to new vertex
        for (const auto& [i, j] : horizon) {
            EpaFace new_face = make_face(vertices, i, j, new_vertex, interior);
            if (new_face.valid) {
                remaining.push_back(new_face);
            }
        }

        if (remaining.empty()) {
            return std::nullopt;
        }
        faces = std::move(remaining);

        if (faces.size() > k_max_epa_faces) {
            break;
        }
    }

    // Out of iterations: best estimate so far
    return penetration_from_face(vertices, faces[closest_face()]);
}

std::optional<Penetration> gjk_epa(const ShapeProxy& a, const ShapeProxy& b) {
    const GjkResult result = gjk(a, b);
    if (!result.intersecting) {
        return std::nullopt;
    }
    return epa(a, b, result.simplex);
}

} // namespace impulse_physics

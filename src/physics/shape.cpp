/// @file shape.cpp
/// @brief Collision shape implementations for impulse_physics

#include <impulse/physics/shape.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <utility>

namespace impulse_physics {

using impulse_math::Vec3;
using impulse_math::Mat3;
using impulse_math::Quat;
using impulse_math::AABB;
using impulse_math::Transform;

namespace {

constexpr float k_unbounded_extent = 1e10f;

/// Shift a tensor taken about the center of mass to a point at `offset` from it
Mat3 parallel_axis(const Mat3& inertia_com, float mass, const Vec3& offset) {
    const float d2 = impulse_math::dot(offset, offset);
    return inertia_com + (impulse_math::mat3::IDENTITY * d2 - impulse_math::outer(offset, offset)) * mass;
}

/// Solid box tensor about its center
Mat3 box_inertia(const Vec3& half_extents, float mass) {
    const float x2 = half_extents.x * half_extents.x;
    const float y2 = half_extents.y * half_extents.y;
    const float z2 = half_extents.z * half_extents.z;
    return impulse_math::mat3_from_diagonal(Vec3(
        mass * (y2 + z2) / 3.0f,
        mass * (x2 + z2) / 3.0f,
        mass * (x2 + y2) / 3.0f));
}

/// Box support in local space
Vec3 box_support(const Vec3& half_extents, const Vec3& direction) {
    return Vec3(
        direction.x >= 0.0f ? half_extents.x : -half_extents.x,
        direction.y >= 0.0f ? half_extents.y : -half_extents.y,
        direction.z >= 0.0f ? half_extents.z : -half_extents.z);
}

/// Bounds of a rotated box given by its center and half extents
AABB rotated_bounds(const AABB& local, const Transform& transform) {
    const Mat3 r = impulse_math::quat_to_mat3(transform.rotation);
    const Vec3 h = local.half_extents();
    Vec3 world_half(0.0f);
    for (int row = 0; row < 3; ++row) {
        world_half[row] = std::abs(r[0][row]) * h.x + std::abs(r[1][row]) * h.y + std::abs(r[2][row]) * h.z;
    }
    return AABB::from_center_half_extents(transform.transform_point(local.center()), world_half);
}

/// Outward facing triangle of a hull under construction
struct HullTriangle {
    std::array<std::uint32_t, 3> v{};
    Vec3 normal{0.0f};
    float offset = 0.0f;
    bool alive = true;
    bool sliver = false;  ///< Near-zero area, carries no usable plane
};

HullTriangle make_triangle(const std::vector<Vec3>& points, std::uint32_t a, std::uint32_t b, std::uint32_t c,
                           const Vec3& interior) {
    HullTriangle tri;
    tri.v = {a, b, c};
    const Vec3 cross = impulse_math::cross(points[b] - points[a], points[c] - points[a]);
    tri.sliver = impulse_math::length_squared(cross) < impulse_math::consts::EPSILON * impulse_math::consts::EPSILON;
    tri.normal = impulse_math::normalize_or(cross, impulse_math::vec3::Y);
    tri.offset = impulse_math::dot(tri.normal, points[a]);
    if (impulse_math::dot(tri.normal, interior) > tri.offset) {
        std::swap(tri.v[1], tri.v[2]);
        tri.normal = -tri.normal;
        tri.offset = -tri.offset;
    }
    return tri;
}

/// Triangles of the hull of @p points, empty when the points span no volume
std::vector<HullTriangle> hull_triangles(const std::vector<Vec3>& points, float tolerance) {
    const auto n = static_cast<std::uint32_t>(points.size());

    // Initial tetrahedron from extreme points
    std::uint32_t i0 = 0;
    for (std::uint32_t i = 1; i < n; ++i) {
        if (points[i].x < points[i0].x) {
            i0 = i;
        }
    }
    std::uint32_t i1 = i0;
    float best = 0.0f;
    for (std::uint32_t i = 0; i < n; ++i) {
        const float d = impulse_math::distance_squared(points[i], points[i0]);
        if (d > best) {
            best = d;
            i1 = i;
        }
    }
    const Vec3 line = impulse_math::normalize_or(points[i1] - points[i0], impulse_math::vec3::X);
    std::uint32_t i2 = i0;
    best = 0.0f;
    for (std::uint32_t i = 0; i < n; ++i) {
        const float d = impulse_math::length_squared(impulse_math::cross(points[i] - points[i0], line));
        if (d > best) {
            best = d;
            i2 = i;
        }
    }
    if (best <= tolerance * tolerance) {
        return {};
    }
    const Vec3 plane = impulse_math::normalize(impulse_math::cross(points[i1] - points[i0], points[i2] - points[i0]));
    std::uint32_t i3 = i0;
    best = 0.0f;
    for (std::uint32_t i = 0; i < n; ++i) {
        const float d = std::abs(impulse_math::dot(points[i] - points[i0], plane));
        if (d > best) {
            best = d;
            i3 = i;
        }
    }
    if (best <= tolerance) {
        return {};
    }

    const Vec3 interior = (points[i0] + points[i1] + points[i2] + points[i3]) * 0.25f;
    std::vector<HullTriangle> triangles = {
        make_triangle(points, i0, i1, i2, interior),
        make_triangle(points, i0, i1, i3, interior),
        make_triangle(points, i0, i2, i3, interior),
        make_triangle(points, i1, i2, i3, interior),
    };

    // Far points first, so points on a face plane arrive after its corners
    std::vector<std::uint32_t> order;
    order.reserve(n);
    for (std::uint32_t i = 0; i < n; ++i) {
        if (i != i0 && i != i1 && i != i2 && i != i3) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(), [&](std::uint32_t a, std::uint32_t b) {
        return impulse_math::distance_squared(points[a], interior) > impulse_math::distance_squared(points[b], interior);
    });

    using Edge = std::pair<std::uint32_t, std::uint32_t>;
    std::vector<Edge> edges;
    for (const std::uint32_t p : order) {

        // Directed edges of every face the point sees
        edges.clear();
        for (auto& tri : triangles) {
            if (!tri.alive || impulse_math::dot(tri.normal, points[p]) - tri.offset <= tolerance) {
                continue;
            }
            tri.alive = false;
            edges.emplace_back(tri.v[0], tri.v[1]);
            edges.emplace_back(tri.v[1], tri.v[2]);
            edges.emplace_back(tri.v[2], tri.v[0]);
        }
        if (edges.empty()) {
            continue;
        }

        // Horizon edges have no reversed twin among the visible faces
        for (const Edge& e : edges) {
            const bool shared = std::find(edges.begin(), edges.end(), Edge{e.second, e.first}) != edges.end();
            if (!shared) {
                triangles.push_back(make_triangle(points, e.first, e.second, p, interior));
            }
        }

        triangles.erase(std::remove_if(triangles.begin(), triangles.end(),
                                       [](const HullTriangle& t) { return !t.alive; }),
                        triangles.end());
    }
    return triangles;
}

float hull_face_area(const ConvexHullShape& hull, const HullFace& face) {
    if (face.indices.size() < 3) {
        return 0.0f;
    }
    const Vec3& origin = hull.vertices[face.indices[0]];
    Vec3 sum(0.0f);
    for (std::size_t i = 1; i + 1 < face.indices.size(); ++i) {
        sum += impulse_math::cross(hull.vertices[face.indices[i]] - origin,
                                   hull.vertices[face.indices[i + 1]] - origin);
    }
    return 0.5f * impulse_math::length(sum);
}

} // anonymous namespace

// =============================================================================
// CapsuleShape Implementation
// =============================================================================

Vec3 CapsuleShape::axis_vector() const noexcept {
    switch (axis) {
        case CapsuleAxis::X: return impulse_math::vec3::X;
        case CapsuleAxis::Z: return impulse_math::vec3::Z;
        case CapsuleAxis::Y:
        default: return impulse_math::vec3::Y;
    }
}

std::pair<Vec3, Vec3> CapsuleShape::endpoints() const noexcept {
    const Vec3 a = axis_vector() * half_height;
    return {-a, a};
}

// =============================================================================
// ConvexHullShape Implementation
// =============================================================================

ConvexHullShape ConvexHullShape::from_points(std::span<const Vec3> points) {
    ConvexHullShape hull;

    Vec3 mean(0.0f);
    for (const auto& p : points) {
        mean += p;
    }
    if (!points.empty()) {
        mean /= static_cast<float>(points.size());
    }
    float extent = 0.0f;
    for (const auto& p : points) {
        extent = std::max(extent, impulse_math::length(p - mean));
    }
    const float tolerance = 1e-6f + 1e-4f * extent;

    // Drop duplicates
    std::vector<Vec3> unique;
    unique.reserve(points.size());
    for (const auto& p : points) {
        const bool seen = std::any_of(unique.begin(), unique.end(), [&](const Vec3& q) {
            return impulse_math::distance_squared(p, q) < tolerance * tolerance;
        });
        if (!seen) {
            unique.push_back(p);
        }
    }

    if (unique.size() < 4) {
        hull.vertices = std::move(unique);
        hull.centroid = mean;
        return hull;
    }

    // Incremental hull over triangles, merged into face planes afterwards
    const auto triangles = hull_triangles(unique, tolerance);
    for (const HullTriangle& tri : triangles) {
        if (tri.sliver) {
            continue;
        }
        const bool duplicate = std::any_of(hull.faces.begin(), hull.faces.end(), [&](const HullFace& f) {
            return impulse_math::dot(f.normal, tri.normal) > 1.0f - 1e-4f &&
                   std::abs(f.offset - tri.offset) < tolerance;
        });
        if (!duplicate) {
            hull.faces.push_back(HullFace{tri.normal, tri.offset, {}});
        }
    }

    // Flat clouds span no volume
    if (hull.faces.size() < 4) {
        hull.faces.clear();
        hull.vertices = std::move(unique);
        hull.centroid = mean;
        return hull;
    }

    // Corners lie on at least three face planes
    for (const auto& p : unique) {
        int touching = 0;
        for (const auto& f : hull.faces) {
            if (std::abs(impulse_math::dot(f.normal, p) - f.offset) <= tolerance) {
                ++touching;
            }
        }
        if (touching >= 3) {
            hull.vertices.push_back(p);
        }
    }

    hull.centroid = Vec3(0.0f);
    for (const auto& v : hull.vertices) {
        hull.centroid += v;
    }
    hull.centroid /= static_cast<float>(hull.vertices.size());

    // Face polygons, wound counter-clockwise around the outward normal
    for (auto& face : hull.faces) {
        Vec3 center(0.0f);
        for (std::uint32_t v = 0; v < hull.vertices.size(); ++v) {
            if (std::abs(impulse_math::dot(face.normal, hull.vertices[v]) - face.offset) <= tolerance) {
                face.indices.push_back(v);
                center += hull.vertices[v];
            }
        }
        if (face.indices.empty()) {
            continue;
        }
        center /= static_cast<float>(face.indices.size());

        const auto [t1, t2] = impulse_math::tangent_basis(face.normal);
        std::sort(face.indices.begin(), face.indices.end(), [&](std::uint32_t a, std::uint32_t b) {
            const Vec3 da = hull.vertices[a] - center;
            const Vec3 db = hull.vertices[b] - center;
            return std::atan2(impulse_math::dot(da, t2), impulse_math::dot(da, t1)) <
                   std::atan2(impulse_math::dot(db, t2), impulse_math::dot(db, t1));
        });
    }

    return hull;
}

ConvexHullShape ConvexHullShape::box(const Vec3& half_extents) {
    const auto corners = AABB(-half_extents, half_extents).corners();
    return from_points(std::span<const Vec3>(corners.data(), corners.size()));
}

// =============================================================================
// CompoundShape Implementation
// =============================================================================

CompoundShape& CompoundShape::add(Shape shape, const Vec3& position, const Quat& rotation) {
    children.push_back(CompoundChild{std::move(shape), position, rotation});
    return *this;
}

// =============================================================================
// Shape Queries
// =============================================================================

ShapeType shape_type(const Shape& shape) noexcept {
    return std::visit([](const auto& s) -> ShapeType {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) return ShapeType::Sphere;
        else if constexpr (std::is_same_v<T, AabbShape>) return ShapeType::Aabb;
        else if constexpr (std::is_same_v<T, BoxShape>) return ShapeType::Box;
        else if constexpr (std::is_same_v<T, CapsuleShape>) return ShapeType::Capsule;
        else if constexpr (std::is_same_v<T, ConvexHullShape>) return ShapeType::ConvexHull;
        else if constexpr (std::is_same_v<T, PlaneShape>) return ShapeType::Plane;
        else if constexpr (std::is_same_v<T, CompoundShape>) return ShapeType::Compound;
        else static_assert(detail::always_false_v<T>, "unhandled shape");
    }, shape);
}

bool is_convex(const Shape& shape) noexcept {
    const ShapeType type = shape_type(shape);
    return type != ShapeType::Plane && type != ShapeType::Compound;
}

bool is_bounded(const Shape& shape) noexcept {
    if (const auto* compound = std::get_if<CompoundShape>(&shape)) {
        return std::all_of(compound->children.begin(), compound->children.end(),
                           [](const CompoundChild& c) { return is_bounded(c.shape); });
    }
    return !std::holds_alternative<PlaneShape>(shape);
}

bool is_degenerate(const Shape& shape) noexcept {
    constexpr float eps = impulse_math::consts::EPSILON;
    return std::visit([](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return !(s.radius > eps) || !std::isfinite(s.radius);
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return !(impulse_math::min_component(s.half_extents) > eps) ||
                   !impulse_math::is_finite(s.half_extents);
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            return !(s.radius > eps) || !(s.half_height >= 0.0f) ||
                   !std::isfinite(s.radius) || !std::isfinite(s.half_height);
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            return !s.is_valid();
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return std::abs(impulse_math::length(s.normal) - 1.0f) > 1e-3f || !std::isfinite(s.offset);
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            return s.children.empty() ||
                   std::any_of(s.children.begin(), s.children.end(),
                               [](const CompoundChild& c) { return is_degenerate(c.shape); });
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

Vec3 local_support(const Shape& shape, const Vec3& direction) {
    return std::visit([&direction](const auto& s) -> Vec3 {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return impulse_math::normalize_or(direction, impulse_math::vec3::Y) * s.radius;
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return box_support(s.half_extents, direction);
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const auto [p0, p1] = s.endpoints();
            const Vec3 center = impulse_math::dot(p0, direction) > impulse_math::dot(p1, direction) ? p0 : p1;
            return center + impulse_math::normalize_or(direction, impulse_math::vec3::Y) * s.radius;
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            Vec3 best = s.centroid;
            float best_dot = -std::numeric_limits<float>::max();
            for (const auto& v : s.vertices) {
                const float d = impulse_math::dot(v, direction);
                if (d > best_dot) {
                    best_dot = d;
                    best = v;
                }
            }
            return best;
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            // Unbounded: the point of the boundary closest to the origin
            return s.normal * s.offset;
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            Vec3 best(0.0f);
            float best_dot = -std::numeric_limits<float>::max();
            for (const auto& child : s.children) {
                const Transform t = child.local_transform();
                const Vec3 local_dir = t.inverse_transform_vector(direction);
                const Vec3 p = t.transform_point(local_support(child.shape, local_dir));
                const float d = impulse_math::dot(p, direction);
                if (d > best_dot) {
                    best_dot = d;
                    best = p;
                }
            }
            return best;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

AABB local_bounds(const Shape& shape) {
    return std::visit([](const auto& s) -> AABB {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return AABB::from_center_half_extents(impulse_math::vec3::ZERO, impulse_math::splat3(s.radius));
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return AABB(-s.half_extents, s.half_extents);
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const Vec3 extent = s.axis_vector() * s.half_height + impulse_math::splat3(s.radius);
            return AABB(-extent, extent);
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            return AABB::from_points(s.vertices);
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return AABB(impulse_math::splat3(-k_unbounded_extent), impulse_math::splat3(k_unbounded_extent));
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            AABB result;
            for (const auto& child : s.children) {
                result.expand_to_include(world_bounds(child.shape, child.local_transform()));
            }
            return result;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

AABB world_bounds(const Shape& shape, const Transform& transform) {
    if (const auto* box = std::get_if<AabbShape>(&shape)) {
        return AABB::from_center_half_extents(transform.position, box->half_extents);
    }
    if (const auto* sphere = std::get_if<SphereShape>(&shape)) {
        return AABB::from_center_half_extents(transform.position, impulse_math::splat3(sphere->radius));
    }
    if (std::holds_alternative<PlaneShape>(shape)) {
        return local_bounds(shape);
    }
    if (const auto* compound = std::get_if<CompoundShape>(&shape)) {
        AABB result;
        for (const auto& child : compound->children) {
            result.expand_to_include(world_bounds(child.shape, transform.combine(child.local_transform())));
        }
        return result;
    }
    return rotated_bounds(local_bounds(shape), transform);
}

float volume(const Shape& shape) {
    constexpr float pi = impulse_math::consts::PI;
    return std::visit([](const auto& s) -> float {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return (4.0f / 3.0f) * pi * s.radius * s.radius * s.radius;
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return 8.0f * s.half_extents.x * s.half_extents.y * s.half_extents.z;
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            // Cylinder + two hemispheres = cylinder + sphere
            const float cylinder = pi * s.radius * s.radius * (2.0f * s.half_height);
            const float sphere = (4.0f / 3.0f) * pi * s.radius * s.radius * s.radius;
            return cylinder + sphere;
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            // Pyramids from the centroid to every face
            float total = 0.0f;
            for (const auto& face : s.faces) {
                const float height = face.offset - impulse_math::dot(face.normal, s.centroid);
                total += hull_face_area(s, face) * height / 3.0f;
            }
            return total;
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return 0.0f;
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            float total = 0.0f;
            for (const auto& child : s.children) {
                total += volume(child.shape);
            }
            return total;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

float min_half_thickness(const Shape& shape) {
    return std::visit([](const auto& s) -> float {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape> || std::is_same_v<T, CapsuleShape>) {
            return s.radius;
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return impulse_math::min_component(s.half_extents);
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            float best = std::numeric_limits<float>::max();
            for (const auto& face : s.faces) {
                best = std::min(best, face.offset - impulse_math::dot(face.normal, s.centroid));
            }
            return s.faces.empty() ? 0.0f : best;
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return std::numeric_limits<float>::max();
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            float best = std::numeric_limits<float>::max();
            for (const auto& child : s.children) {
                best = std::min(best, min_half_thickness(child.shape));
            }
            return s.children.empty() ? 0.0f : best;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

// =============================================================================
// Mass Properties
// =============================================================================

MassProperties compute_mass_properties(const Shape& shape, float mass) {
    MassProperties props;
    props.mass = mass;

    std::visit([&props, mass](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            // Solid sphere (uniform in all directions)
            props.inertia = impulse_math::mat3_from_diagonal(impulse_math::splat3(0.4f * mass * s.radius * s.radius));
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            props.inertia = box_inertia(s.half_extents, mass);
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const float total = volume(Shape(s));
            const float cylinder_volume = impulse_math::consts::PI * s.radius * s.radius * (2.0f * s.half_height);
            const float mc = total > 0.0f ? mass * cylinder_volume / total : 0.0f;
            const float ms = mass - mc;
            const float r2 = s.radius * s.radius;
            const float h = s.half_height;

            const float axial = mc * r2 * 0.5f + ms * 0.4f * r2;
            const float transverse = mc * (r2 * 0.25f + h * h / 3.0f) +
                                     ms * (0.4f * r2 + h * h + 0.75f * h * s.radius);

            Vec3 diag = impulse_math::splat3(transverse);
            diag[static_cast<int>(s.axis)] = axial;
            props.inertia = impulse_math::mat3_from_diagonal(diag);
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            // Approximated by the hull's bounding box about the centroid
            const AABB bounds = AABB::from_points(s.vertices);
            props.center_of_mass = s.centroid;
            props.inertia = parallel_axis(box_inertia(bounds.half_extents(), mass), mass, s.centroid);
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            props.inertia = impulse_math::mat3::ZERO;
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            float total_volume = 0.0f;
            for (const auto& child : s.children) {
                total_volume += volume(child.shape);
            }

            Mat3 inertia = impulse_math::mat3::ZERO;
            Vec3 weighted_com(0.0f);
            for (const auto& child : s.children) {
                const float child_mass = total_volume > 0.0f
                    ? mass * volume(child.shape) / total_volume
                    : mass / static_cast<float>(s.children.size());
                const MassProperties child_props = compute_mass_properties(child.shape, child_mass);

                // Child tensor about its own center of mass, in the compound frame
                const Mat3 r = impulse_math::quat_to_mat3(child.rotation);
                const Mat3 about_com = parallel_axis(child_props.inertia, -child_mass, child_props.center_of_mass);
                const Vec3 com = child.position + child.rotation * child_props.center_of_mass;

                inertia += parallel_axis(impulse_math::rotate_tensor(r, about_com), child_mass, com);
                weighted_com += com * child_mass;
            }

            props.inertia = inertia;
            props.center_of_mass = mass > 0.0f ? weighted_com / mass : Vec3(0.0f);
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);

    return props;
}

// =============================================================================
// Point Containment
// =============================================================================

bool contains_point(const Shape& shape, const Vec3& point) {
    return std::visit([&point](const auto& s) -> bool {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return impulse_math::dot(point, point) <= s.radius * s.radius;
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return std::abs(point.x) <= s.half_extents.x &&
                   std::abs(point.y) <= s.half_extents.y &&
                   std::abs(point.z) <= s.half_extents.z;
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const float along = std::clamp(impulse_math::dot(point, s.axis_vector()), -s.half_height, s.half_height);
            return impulse_math::length_squared(point - s.axis_vector() * along) <= s.radius * s.radius;
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            if (!s.is_valid()) return false;
            return std::all_of(s.faces.begin(), s.faces.end(), [&point](const HullFace& f) {
                return impulse_math::dot(f.normal, point) <= f.offset;
            });
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            return s.signed_distance(point) <= 0.0f;
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            return std::any_of(s.children.begin(), s.children.end(), [&point](const CompoundChild& c) {
                return contains_point(c.shape, c.local_transform().inverse_transform_point(point));
            });
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

// =============================================================================
// Scaling
// =============================================================================

Shape scaled(const Shape& shape, const Vec3& scale) {
    const Vec3 factor = impulse_math::abs(scale);
    return std::visit([&](const auto& s) -> Shape {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, SphereShape>) {
            return SphereShape{s.radius * impulse_math::max_component(factor)};
        } else if constexpr (std::is_same_v<T, AabbShape> || std::is_same_v<T, BoxShape>) {
            return T{s.half_extents * factor};
        } else if constexpr (std::is_same_v<T, CapsuleShape>) {
            const int along = static_cast<int>(s.axis);
            float across = 0.0f;
            for (int i = 0; i < 3; ++i) {
                if (i != along) {
                    across = std::max(across, factor[i]);
                }
            }
            return CapsuleShape{s.radius * across, s.half_height * factor[along], s.axis};
        } else if constexpr (std::is_same_v<T, ConvexHullShape>) {
            std::vector<Vec3> points;
            points.reserve(s.vertices.size());
            for (const auto& v : s.vertices) {
                points.push_back(v * scale);
            }
            return ConvexHullShape::from_points(points);
        } else if constexpr (std::is_same_v<T, PlaneShape>) {
            // dot(n, p) = d becomes dot(n / scale, p') = d
            const Vec3 n = s.normal / scale;
            const float len = impulse_math::length(n);
            return PlaneShape{n / len, s.offset / len};
        } else if constexpr (std::is_same_v<T, CompoundShape>) {
            CompoundShape result;
            for (const auto& child : s.children) {
                result.add(scaled(child.shape, scale), child.position * scale, child.rotation);
            }
            return result;
        } else {
            static_assert(detail::always_false_v<T>, "unhandled shape");
        }
    }, shape);
}

} // namespace impulse_physics

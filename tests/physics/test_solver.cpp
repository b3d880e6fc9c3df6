// impulse_physics contact solver tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/solver.hpp>
#include <impulse/physics/config.hpp>
#include <cmath>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

constexpr float k_dt = 1.0f / 60.0f;
constexpr float k_gravity = 9.81f;

SolverBody make_ground() {
    SolverBody ground;
    ground.id = BodyId{1};
    return ground;
}

/// Unit box of mass 1 resting on the ground, already carrying one step of gravity
SolverBody make_resting_box() {
    SolverBody box;
    box.id = BodyId{2};
    box.position = Vec3(0.0f, 0.5f, 0.0f);
    box.linear_velocity = Vec3(0.0f, -k_gravity * k_dt, 0.0f);
    box.inverse_mass = 1.0f;
    box.local_inverse_inertia = Mat3(6.0f);  // 1 / (m * (1 + 1) / 12)
    box.update_inertia();
    return box;
}

/// Four bottom corners of the box touching the ground
ContactManifold make_face_manifold(float per_point_impulse) {
    ContactManifold m;
    m.body_a = BodyId{1};
    m.body_b = BodyId{2};
    m.normal = vec3::UP;
    m.update_tangents();
    m.friction = 0.5f;

    for (float x : {-0.5f, 0.5f}) {
        for (float z : {-0.5f, 0.5f}) {
            ContactPoint cp;
            cp.point_a = Vec3(x, 0.0f, z);
            cp.point_b = cp.point_a;
            cp.local_a = cp.point_a;
            cp.local_b = Vec3(x, -0.5f, z);
            cp.normal_impulse = per_point_impulse;
            m.points.push_back(cp);
        }
    }
    return m;
}

std::vector<ContactConstraint> make_constraints(ContactManifold& m) {
    ContactConstraint c;
    c.manifold = &m;
    c.index_a = 0;
    c.index_b = 1;
    return {c};
}

} // anonymous namespace

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("SolverConfig from world config", "[physics][solver]") {
    PhysicsWorldConfig world = PhysicsWorldConfig::defaults();
    world.solver_iterations = 17;
    world.slop = 0.01f;
    world.warm_starting = false;

    SolverConfig config = SolverConfig::from_world(world);
    REQUIRE(config.velocity_iterations == 17);
    REQUIRE(config.slop == 0.01f);
    REQUIRE_FALSE(config.warm_starting);
}

// =============================================================================
// Velocity Tests
// =============================================================================

TEST_CASE("Resting contact cancels approach velocity", "[physics][solver]") {
    ContactManifold m = make_face_manifold(0.0f);
    auto constraints = make_constraints(m);
    std::vector<SolverBody> bodies{make_ground(), make_resting_box()};

    ContactSolver solver;
    solver.prepare(constraints, bodies, k_dt);
    for (int i = 0; i < 30; ++i) {
        solver.solve_velocity(constraints, bodies);
    }

    REQUIRE_THAT(bodies[1].linear_velocity.y, WithinAbs(0.0f, 1e-3f));
    REQUIRE_THAT(length(bodies[1].angular_velocity), WithinAbs(0.0f, 1e-3f));
    REQUIRE_THAT(m.total_normal_impulse(), WithinAbs(k_gravity * k_dt, 1e-3f));

    // Static ground never moves
    REQUIRE(bodies[0].linear_velocity == vec3::ZERO);
}

TEST_CASE("Warm starting converges faster", "[physics][solver]") {
    constexpr float k_converged = 1e-6f;
    constexpr int k_max_iterations = 500;

    struct Run {
        ContactManifold manifold;
        std::vector<SolverBody> bodies{make_ground(), make_resting_box()};
        int iterations = 0;
        std::vector<float> energies;  // Box kinetic energy after each iteration

        float kinetic_energy() const {
            const SolverBody& box = bodies[1];
            const Vec3 spin = inverse_or_zero(box.inverse_inertia) * box.angular_velocity;
            return 0.5f * dot(box.linear_velocity, box.linear_velocity) / box.inverse_mass +
                   0.5f * dot(box.angular_velocity, spin);
        }

        void solve(float carried, bool warm_starting) {
            manifold = make_face_manifold(carried);
            manifold.friction = 0.0f;
            auto constraints = make_constraints(manifold);

            SolverConfig config;
            config.warm_starting = warm_starting;
            ContactSolver solver(config);
            solver.prepare(constraints, bodies, k_dt);
            solver.warm_start(constraints, bodies);
            if (!warm_starting) {
                REQUIRE(manifold.points[0].normal_impulse == 0.0f);
            }

            while (iterations < k_max_iterations) {
                const float residual = solver.solve_velocity(constraints, bodies);
                ++iterations;
                energies.push_back(kinetic_energy());
                if (residual < k_converged) {
                    break;
                }
            }
        }
    };

    const float carried = k_gravity * k_dt / 4.0f;
    Run warm;
    warm.solve(carried, true);
    Run cold;
    cold.solve(carried, false);

    REQUIRE(warm.iterations < k_max_iterations);
    REQUIRE(cold.iterations < k_max_iterations);
    REQUIRE(warm.iterations < cold.iterations);

    // Each sweep only removes approach energy
    for (const Run* run : {&warm, &cold}) {
        for (std::size_t i = 1; i < run->energies.size(); ++i) {
            REQUIRE(run->energies[i] <= run->energies[i - 1] + 1e-7f);
        }
    }

    // Same end state: the four-point split is not unique, the total and the velocities are
    REQUIRE_THAT(warm.manifold.total_normal_impulse(), WithinAbs(cold.manifold.total_normal_impulse(), 1e-4f));
    REQUIRE_THAT(warm.manifold.total_normal_impulse(), WithinAbs(k_gravity * k_dt, 1e-4f));
    for (const Run* run : {&warm, &cold}) {
        for (const auto& cp : run->manifold.points) {
            REQUIRE(cp.normal_impulse >= 0.0f);
        }
        REQUIRE_THAT(run->bodies[1].linear_velocity.y, WithinAbs(0.0f, 1e-4f));
        REQUIRE_THAT(length(run->bodies[1].angular_velocity), WithinAbs(0.0f, 1e-4f));
    }
}

TEST_CASE("Normal impulses never pull", "[physics][solver]") {
    ContactManifold m = make_face_manifold(0.0f);
    auto constraints = make_constraints(m);
    std::vector<SolverBody> bodies{make_ground(), make_resting_box()};
    bodies[1].linear_velocity = Vec3(0.0f, 2.0f, 0.0f);  // Separating

    ContactSolver solver;
    solver.prepare(constraints, bodies, k_dt);
    solver.solve_velocity(constraints, bodies);

    for (const auto& cp : m.points) {
        REQUIRE(cp.normal_impulse == 0.0f);
    }
    REQUIRE(bodies[1].linear_velocity.y == 2.0f);
}

TEST_CASE("Friction is bounded by the normal impulse", "[physics][solver]") {
    ContactManifold m = make_face_manifold(0.0f);
    m.friction = 0.2f;
    auto constraints = make_constraints(m);
    std::vector<SolverBody> bodies{make_ground(), make_resting_box()};
    bodies[1].linear_velocity.x = 5.0f;

    ContactSolver solver;
    solver.prepare(constraints, bodies, k_dt);
    for (int i = 0; i < 20; ++i) {
        solver.solve_velocity(constraints, bodies);
    }

    for (const auto& cp : m.points) {
        const float tangent = std::sqrt(cp.tangent_impulse_1 * cp.tangent_impulse_1 +
                                        cp.tangent_impulse_2 * cp.tangent_impulse_2);
        REQUIRE(tangent <= m.friction * cp.normal_impulse * std::sqrt(2.0f) + 1e-5f);
    }
    // Sliding slows down but does not stop in one step
    REQUIRE(bodies[1].linear_velocity.x < 5.0f);
    REQUIRE(bodies[1].linear_velocity.x > 4.0f);
}

TEST_CASE("Restitution bias above the threshold", "[physics][solver]") {
    ContactManifold m = make_face_manifold(0.0f);
    m.friction = 0.0f;
    m.restitution = 0.5f;
    auto constraints = make_constraints(m);
    std::vector<SolverBody> bodies{make_ground(), make_resting_box()};

    SECTION("fast impact bounces") {
        bodies[1].linear_velocity = Vec3(0.0f, -4.0f, 0.0f);
        ContactSolver solver;
        solver.prepare(constraints, bodies, k_dt);
        for (int i = 0; i < 30; ++i) {
            solver.solve_velocity(constraints, bodies);
        }
        REQUIRE_THAT(bodies[1].linear_velocity.y, WithinAbs(2.0f, 1e-2f));
    }

    SECTION("slow impact does not bounce") {
        bodies[1].linear_velocity = Vec3(0.0f, -0.5f, 0.0f);
        ContactSolver solver;
        solver.prepare(constraints, bodies, k_dt);
        for (int i = 0; i < 30; ++i) {
            solver.solve_velocity(constraints, bodies);
        }
        REQUIRE_THAT(bodies[1].linear_velocity.y, WithinAbs(0.0f, 1e-3f));
    }
}

// =============================================================================
// Position Tests
// =============================================================================

TEST_CASE("Position pass pushes overlap out", "[physics][solver]") {
    ContactManifold m = make_face_manifold(0.0f);
    auto constraints = make_constraints(m);
    std::vector<SolverBody> bodies{make_ground(), make_resting_box()};
    bodies[1].position.y = 0.4f;  // 0.1 deep

    ContactSolver solver;
    const float before = solver.solve_position(constraints, bodies);
    REQUIRE_THAT(before, WithinAbs(-0.1f, 1e-5f));
    REQUIRE(bodies[1].position.y > 0.4f);

    float deepest = before;
    for (int i = 0; i < 40; ++i) {
        deepest = solver.solve_position(constraints, bodies);
    }
    // Converges to within the slop
    REQUIRE(deepest > -solver.config().slop - 1e-3f);
    REQUIRE(bodies[0].position == vec3::ZERO);
}

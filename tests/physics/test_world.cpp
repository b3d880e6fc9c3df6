// impulse_physics world stepping tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/physics.hpp>
#include <cmath>
#include <limits>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

PhysicsWorldConfig zero_gravity() {
    PhysicsWorldConfig config;
    config.gravity = vec3::ZERO;
    return config;
}

/// Two spheres heading at each other along X
struct HeadOn {
    PhysicsWorld world{zero_gravity()};
    BodyId left;
    BodyId right;

    HeadOn(float v_left, float v_right, float restitution) {
        left = world.create_body(BodyBuilder().position(-2.0f, 0.0f, 0.0f)
                                              .linear_velocity(Vec3(v_left, 0.0f, 0.0f))
                                              .linear_damping(0.0f).angular_damping(0.0f)
                                              .restitution(restitution).friction(0.0f)
                                              .with_sphere(0.5f)).unwrap();
        right = world.create_body(BodyBuilder().position(2.0f, 0.0f, 0.0f)
                                               .linear_velocity(Vec3(v_right, 0.0f, 0.0f))
                                               .linear_damping(0.0f).angular_damping(0.0f)
                                               .restitution(restitution).friction(0.0f)
                                               .with_sphere(0.5f)).unwrap();
    }

    void run(int steps) {
        for (int i = 0; i < steps; ++i) {
            world.step_fixed();
        }
    }
};

/// Ground plus a few separate stacks, each its own island
void build_stacks(PhysicsWorld& world) {
    REQUIRE(world.create_body(BodyBuilder().static_body().with_plane(vec3::UP, 0.0f)).is_ok());
    for (int stack = 0; stack < 4; ++stack) {
        const float x = static_cast<float>(stack) * 4.0f;
        for (int level = 0; level < 3; ++level) {
            const float y = 0.49f + static_cast<float>(level) * 0.98f;
            REQUIRE(world.create_body(BodyBuilder().position(x, y, 0.0f).with_box(Vec3(0.5f))).is_ok());
        }
    }
}

} // anonymous namespace

// =============================================================================
// Time Stepping Tests
// =============================================================================

TEST_CASE("step accumulates partial time", "[physics][world]") {
    PhysicsWorld world;
    const float fixed = world.config().fixed_dt;

    REQUIRE(world.step(fixed * 0.5f) == 0);
    REQUIRE_THAT(world.accumulator(), WithinAbs(fixed * 0.5f, 1e-7f));
    REQUIRE(world.stats().substeps == 0);

    REQUIRE(world.step(fixed * 0.5f) == 1);
    REQUIRE(world.accumulator() < fixed);
    REQUIRE(world.stats().total_steps == 1);
}

TEST_CASE("step drops time beyond max_substeps", "[physics][world]") {
    PhysicsWorld world;
    REQUIRE(world.step(1.0f) == world.config().max_substeps);
    REQUIRE(world.stats().substeps == world.config().max_substeps);
    REQUIRE(world.accumulator() >= 0.0f);
    REQUIRE(world.accumulator() < world.config().fixed_dt);

    // The backlog does not spill into the next call
    REQUIRE(world.step(world.config().fixed_dt * 0.25f) == 0);
}

TEST_CASE("step ignores invalid dt", "[physics][world]") {
    PhysicsWorld world;
    const BodyId ball = world.create_body(BodyBuilder().position(0.0f, 5.0f, 0.0f).with_sphere(0.5f)).unwrap();

    REQUIRE(world.step(0.0f) == 0);
    REQUIRE(world.step(-1.0f) == 0);
    REQUIRE(world.step(std::numeric_limits<float>::quiet_NaN()) == 0);
    REQUIRE(world.step(std::numeric_limits<float>::infinity()) == 0);
    REQUIRE(world.accumulator() == 0.0f);
    REQUIRE(world.body(ball)->position().y == 5.0f);
}

TEST_CASE("step with an explicit config", "[physics][world]") {
    PhysicsWorld world;

    SECTION("a valid config is applied") {
        PhysicsWorldConfig config;
        config.fixed_dt = 1.0f / 30.0f;
        config.max_substeps = 2;
        auto result = step(world, 0.1f, config);
        REQUIRE(result.is_ok());
        REQUIRE(result.value() == 2);
        REQUIRE(world.config() == config);
    }

    SECTION("an invalid config is rejected without stepping") {
        PhysicsWorldConfig config;
        config.fixed_dt = -1.0f;
        auto result = step(world, 0.1f, config);
        REQUIRE(result.is_err());
        REQUIRE(world.stats().total_steps == 0);
        REQUIRE(world.config() == PhysicsWorldConfig::defaults());
    }
}

TEST_CASE("Invalid config falls back to defaults", "[physics][world]") {
    PhysicsWorldConfig config;
    config.max_substeps = 0;
    PhysicsWorld world(config);
    REQUIRE(world.config() == PhysicsWorldConfig::defaults());

    REQUIRE(world.set_config(config).is_err());
    REQUIRE(world.config() == PhysicsWorldConfig::defaults());
}

// =============================================================================
// Body Management Tests
// =============================================================================

TEST_CASE("create_body validates descriptions", "[physics][world]") {
    PhysicsWorld world;

    REQUIRE(world.create_body(BodyBuilder().mass(0.0f).with_sphere(0.5f)).is_err());
    REQUIRE(world.create_body(BodyBuilder().restitution(1.5f).with_sphere(0.5f)).is_err());
    REQUIRE(world.create_body(BodyBuilder().position(NAN, 0.0f, 0.0f)).is_err());
    REQUIRE(world.create_body(BodyBuilder().with_plane(vec3::UP, 0.0f)).is_err());
    REQUIRE(world.body_count() == 0);

    const BodyId a = world.create_body(BodyBuilder().with_sphere(0.5f)).unwrap();
    const BodyId b = world.create_body(BodyBuilder().with_sphere(0.5f)).unwrap();
    REQUIRE(a != b);
    REQUIRE(world.has_body(a));

    REQUIRE(world.remove_body(a).is_ok());
    REQUIRE_FALSE(world.has_body(a));
    REQUIRE(world.body(a) == nullptr);
    REQUIRE(world.remove_body(a).is_err());
    REQUIRE(world.body(b) != nullptr);
}

TEST_CASE("A body without a collider still integrates", "[physics][world]") {
    PhysicsWorld world;
    const BodyId ghost = world.create_body(BodyBuilder().position(0.0f, 10.0f, 0.0f)).unwrap();

    for (int i = 0; i < 60; ++i) {
        world.step_fixed();
    }

    // Roughly half a second of free fall
    const RigidBody* body = world.body(ghost);
    REQUIRE(body->position().y < 9.0f);
    REQUIRE(body->linear_velocity().y < -4.0f);
    REQUIRE(world.manifolds().empty());
}

TEST_CASE("Non-finite state is rolled back", "[physics][world]") {
    PhysicsWorld world;
    const BodyId ball = world.create_body(BodyBuilder().position(0.0f, 10.0f, 0.0f).with_sphere(0.5f)).unwrap();
    world.step_fixed();
    const Vec3 last_good = world.body(ball)->position();

    world.body(ball)->set_linear_velocity(Vec3(NAN, 0.0f, 0.0f));
    world.step_fixed();

    const RigidBody* body = world.body(ball);
    REQUIRE(body->has_finite_state());
    REQUIRE(body->position() == last_good);
    REQUIRE(body->linear_velocity() == vec3::ZERO);

    // Simulation carries on normally afterwards
    world.step_fixed();
    REQUIRE(world.body(ball)->position().y < last_good.y);
}

// =============================================================================
// Dynamics Tests
// =============================================================================

TEST_CASE("Elastic head-on collision swaps velocities", "[physics][world]") {
    HeadOn scene(5.0f, -5.0f, 1.0f);
    scene.run(60);

    REQUIRE_THAT(scene.world.body(scene.left)->linear_velocity().x, WithinAbs(-5.0f, 0.25f));
    REQUIRE_THAT(scene.world.body(scene.right)->linear_velocity().x, WithinAbs(5.0f, 0.25f));
}

TEST_CASE("Inelastic collision shares momentum", "[physics][world]") {
    HeadOn scene(6.0f, -2.0f, 0.0f);
    scene.run(90);

    const float vl = scene.world.body(scene.left)->linear_velocity().x;
    const float vr = scene.world.body(scene.right)->linear_velocity().x;
    REQUIRE_THAT(vl, WithinAbs(2.0f, 0.1f));
    REQUIRE_THAT(vr, WithinAbs(2.0f, 0.1f));
    REQUIRE_THAT(vl + vr, WithinAbs(4.0f, 1e-3f));
}

TEST_CASE("Kinematic bodies follow their velocity", "[physics][world]") {
    PhysicsWorld world;
    const BodyId platform = world.create_body(
        BodyBuilder().kinematic_body().linear_velocity(Vec3(1.0f, 0.0f, 0.0f)).with_box(Vec3(2.0f, 0.1f, 2.0f))).unwrap();

    for (int i = 0; i < 120; ++i) {
        world.step_fixed();
    }

    // Gravity does not act on it
    const RigidBody* body = world.body(platform);
    REQUIRE_THAT(body->position().x, WithinAbs(1.0f, 1e-3f));
    REQUIRE(body->position().y == 0.0f);
}

TEST_CASE("Forces and impulses", "[physics][world]") {
    PhysicsWorld world(zero_gravity());
    const BodyId box = world.create_body(
        BodyBuilder().mass(2.0f).linear_damping(0.0f).with_box(Vec3(0.5f))).unwrap();
    const float dt = world.config().fixed_dt;

    SECTION("forces last one step") {
        world.body(box)->apply_force(Vec3(2.0f, 0.0f, 0.0f));
        world.step_fixed();
        REQUIRE_THAT(world.body(box)->linear_velocity().x, WithinAbs(dt, 1e-6f));

        world.step_fixed();
        REQUIRE_THAT(world.body(box)->linear_velocity().x, WithinAbs(dt, 1e-6f));
    }

    SECTION("impulses change velocity immediately") {
        world.body(box)->apply_impulse(Vec3(0.0f, 0.0f, 4.0f));
        REQUIRE(world.body(box)->linear_velocity().z == 2.0f);
    }
}

TEST_CASE("Gravity scale", "[physics][world]") {
    PhysicsWorld world;
    const BodyId balloon = world.create_body(
        BodyBuilder().position(0.0f, 3.0f, 0.0f).gravity_scale(0.0f).with_sphere(0.5f)).unwrap();
    const BodyId rock = world.create_body(
        BodyBuilder().position(5.0f, 3.0f, 0.0f).gravity_scale(2.0f).with_sphere(0.5f)).unwrap();

    for (int i = 0; i < 30; ++i) {
        world.step_fixed();
    }

    REQUIRE(world.body(balloon)->position().y == 3.0f);
    REQUIRE(world.body(rock)->linear_velocity().y < -4.0f);
}

TEST_CASE("Velocity is clamped to the configured maximum", "[physics][world]") {
    PhysicsWorldConfig config = zero_gravity();
    config.max_linear_velocity = 10.0f;
    PhysicsWorld world(config);
    const BodyId ball = world.create_body(
        BodyBuilder().linear_velocity(Vec3(50.0f, 0.0f, 0.0f)).linear_damping(0.0f).with_sphere(0.5f)).unwrap();

    world.step_fixed();

    REQUIRE(length(world.body(ball)->linear_velocity()) <= 10.0f + 1e-4f);
    REQUIRE_THAT(world.body(ball)->position().x, WithinAbs(10.0f * config.fixed_dt, 1e-4f));
}

// =============================================================================
// Collider Tests
// =============================================================================

TEST_CASE("Collider offset moves the shape", "[physics][world]") {
    PhysicsWorld world;
    const BodyId body = world.create_body(
        BodyBuilder().static_body().position(0.0f, 5.0f, 0.0f)
                     .with_sphere(0.5f).collider_offset(Vec3(0.0f, -1.0f, 0.0f))).unwrap();

    auto hit = world.raycast(Vec3(0.0f, 10.0f, 0.0f), vec3::DOWN, 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE(hit->body == body);
    REQUIRE_THAT(hit->point.y, WithinAbs(4.5f - 1.0f, 1e-4f));
}

TEST_CASE("Body scale stretches the collider", "[physics][world]") {
    SECTION("scaled offset and radius") {
        PhysicsWorld world;
        const BodyId body = world.create_body(
            BodyBuilder().static_body().position(0.0f, 5.0f, 0.0f).scale(2.0f)
                         .with_sphere(0.5f).collider_offset(Vec3(0.0f, -1.0f, 0.0f))).unwrap();

        auto hit = world.raycast(Vec3(0.0f, 10.0f, 0.0f), vec3::DOWN, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->body == body);
        REQUIRE_THAT(hit->point.y, WithinAbs(5.0f - 2.0f + 1.0f, 1e-4f));
    }

    SECTION("tall box rests on its scaled height") {
        PhysicsWorld world;
        REQUIRE(world.create_body(BodyBuilder().static_body().with_plane(vec3::UP, 0.0f)).is_ok());
        const BodyId box = world.create_body(
            BodyBuilder().position(0.0f, 1.2f, 0.0f).scale(Vec3(1.0f, 2.0f, 1.0f)).with_box(Vec3(0.5f))).unwrap();

        for (int i = 0; i < 180; ++i) {
            world.step_fixed();
        }
        REQUIRE_THAT(world.body(box)->position().y, WithinAbs(1.0f, 0.05f));
    }
}

TEST_CASE("Layers filter collisions", "[physics][world]") {
    PhysicsWorld world;
    REQUIRE(world.create_body(BodyBuilder().static_body().with_plane(vec3::UP, 0.0f)).is_ok());
    const BodyId solid = world.create_body(BodyBuilder().position(0.0f, 2.0f, 0.0f).with_sphere(0.5f)).unwrap();
    const BodyId debris = world.create_body(
        BodyBuilder().position(3.0f, 2.0f, 0.0f).with_sphere(0.5f)
                     .layer(layers::Debris).collides_with(layers::Debris)).unwrap();

    for (int i = 0; i < 180; ++i) {
        world.step_fixed();
    }

    REQUIRE_THAT(world.body(solid)->position().y, WithinAbs(0.5f, 0.05f));
    REQUIRE(world.body(debris)->position().y < -1.0f);
}

// =============================================================================
// Parallel Islands
// =============================================================================

TEST_CASE("Parallel islands match sequential solving", "[physics][world]") {
    PhysicsWorldConfig parallel_config;
    parallel_config.parallel_islands = true;
    parallel_config.worker_threads = 4;

    PhysicsWorld sequential;
    PhysicsWorld parallel(parallel_config);
    build_stacks(sequential);
    build_stacks(parallel);

    for (int i = 0; i < 120; ++i) {
        sequential.step_fixed();
        parallel.step_fixed();
        REQUIRE(parallel.stats().failed_islands == 0);
    }

    REQUIRE(parallel.stats().islands == sequential.stats().islands);

    const WorldSnapshot a = sequential.snapshot();
    const WorldSnapshot b = parallel.snapshot();
    REQUIRE(a.bodies.size() == b.bodies.size());
    for (std::size_t i = 0; i < a.bodies.size(); ++i) {
        REQUIRE(a.bodies[i].id == b.bodies[i].id);
        REQUIRE_THAT(a.bodies[i].position.x, WithinAbs(b.bodies[i].position.x, 1e-5f));
        REQUIRE_THAT(a.bodies[i].position.y, WithinAbs(b.bodies[i].position.y, 1e-5f));
        REQUIRE_THAT(a.bodies[i].position.z, WithinAbs(b.bodies[i].position.z, 1e-5f));
    }
}

// =============================================================================
// Inspection Tests
// =============================================================================

TEST_CASE("Snapshot and stats describe the world", "[physics][world]") {
    PhysicsWorld world;
    build_stacks(world);
    world.step_fixed();

    const PhysicsStats& stats = world.stats();
    REQUIRE(stats.bodies == 13);
    REQUIRE(stats.awake_bodies == 12);
    REQUIRE(stats.islands == 4);
    REQUIRE(stats.manifolds > 0);
    REQUIRE(stats.contact_points >= stats.manifolds);
    REQUIRE(stats.total_steps == 1);
    REQUIRE(stats.substeps == 1);

    const WorldSnapshot snap = world.snapshot();
    REQUIRE(snap.step == 1);
    REQUIRE(snap.bodies.size() == 13);
    for (std::size_t i = 1; i < snap.bodies.size(); ++i) {
        REQUIRE(snap.bodies[i - 1].id < snap.bodies[i].id);
    }

    const BodySnapshot* ground = snap.find(snap.bodies[0].id);
    REQUIRE(ground != nullptr);
    REQUIRE(ground->type == BodyType::Static);
    REQUIRE(snap.find(BodyId{999}) == nullptr);
}

TEST_CASE("clear empties the world", "[physics][world]") {
    PhysicsWorld world;
    build_stacks(world);
    world.step(0.05f);

    world.clear();

    REQUIRE(world.body_count() == 0);
    REQUIRE(world.joint_count() == 0);
    REQUIRE(world.manifolds().empty());
    REQUIRE(world.accumulator() == 0.0f);
    REQUIRE(world.snapshot().bodies.empty());

    // Still usable
    REQUIRE(world.create_body(BodyBuilder().with_sphere(0.5f)).is_ok());
    world.step_fixed();
}

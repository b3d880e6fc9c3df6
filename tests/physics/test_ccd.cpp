// impulse_physics continuous collision tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/ccd.hpp>
#include <impulse/physics/world.hpp>

#include <utility>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

Transform at(float x, float y, float z) {
    return Transform{Vec3(x, y, z), quat::IDENTITY};
}

/// Thin wall at x = 5 and a fast small projectile heading for it
struct BulletScene {
    PhysicsWorld world;
    BodyId wall;
    BodyId bullet;

    explicit BulletScene(bool continuous, Shape projectile = SphereShape{0.1f}) : world(make_config()) {
        wall = world.create_body(
            BodyBuilder().static_body().position(5.0f, 0.0f, 0.0f).with_box(Vec3(0.05f, 2.0f, 2.0f))).unwrap();
        bullet = world.create_body(
            BodyBuilder().position(0.3f, 0.0f, 0.0f)
                         .linear_velocity(Vec3(200.0f, 0.0f, 0.0f))
                         .linear_damping(0.0f)
                         .continuous(continuous)
                         .with_shape(std::move(projectile))).unwrap();
    }

    static PhysicsWorldConfig make_config() {
        PhysicsWorldConfig config;
        config.gravity = vec3::ZERO;
        return config;
    }
};

} // anonymous namespace

// =============================================================================
// Time of Impact Tests
// =============================================================================

TEST_CASE("Time of impact against a thin wall", "[physics][ccd]") {
    const Shape ball = SphereShape{0.1f};
    const Shape wall = BoxShape{Vec3(0.05f, 2.0f, 2.0f)};

    auto toi = compute_toi(ball, at(0, 0, 0), Vec3(10.0f, 0.0f, 0.0f),
                           wall, at(5, 0, 0), vec3::ZERO);

    REQUIRE(toi.hit());
    // Surfaces meet when the center reaches 4.85
    REQUIRE_THAT(toi.t, WithinAbs(0.485f, 1e-3f));
    REQUIRE(toi.t <= 0.485f);
    REQUIRE_THAT(toi.contact.normal.x, WithinAbs(1.0f, 1e-3f));
    REQUIRE_FALSE(toi.contact.points.empty());
}

TEST_CASE("Time of impact for polyhedral and capsule shapes", "[physics][ccd]") {
    const Shape wall = BoxShape{Vec3(0.05f, 2.0f, 2.0f)};

    SECTION("box") {
        const Shape cube = BoxShape{Vec3(0.1f)};
        auto toi = compute_toi(cube, at(0, 0, 0), Vec3(10.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.hit());
        REQUIRE_THAT(toi.t, WithinAbs(0.485f, 1e-3f));
        REQUIRE_THAT(toi.contact.normal.x, WithinAbs(1.0f, 1e-3f));
        REQUIRE_FALSE(toi.contact.points.empty());
    }

    SECTION("capsule") {
        const Shape capsule = CapsuleShape{0.1f, 0.2f, CapsuleAxis::Y};
        auto toi = compute_toi(capsule, at(0, 0, 0), Vec3(10.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.hit());
        REQUIRE_THAT(toi.t, WithinAbs(0.485f, 1e-3f));
        REQUIRE_FALSE(toi.contact.points.empty());
    }
}

TEST_CASE("Time of impact with both shapes moving", "[physics][ccd]") {
    const Shape ball = SphereShape{0.25f};

    // Closing at 4 m over the step; surfaces 3.5 m apart
    auto toi = compute_toi(ball, at(-2, 0, 0), Vec3(2.0f, 0.0f, 0.0f),
                           ball, at(2, 0, 0), Vec3(-2.0f, 0.0f, 0.0f));

    REQUIRE(toi.hit());
    REQUIRE_THAT(toi.t, WithinAbs(0.875f, 1e-3f));
}

TEST_CASE("Time of impact without contact", "[physics][ccd]") {
    const Shape ball = SphereShape{0.1f};
    const Shape wall = BoxShape{Vec3(0.05f, 2.0f, 2.0f)};

    SECTION("moving away") {
        auto toi = compute_toi(ball, at(0, 0, 0), Vec3(-10.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.state == TimeOfImpact::State::Separated);
        REQUIRE(toi.t == 1.0f);
    }

    SECTION("passing beside") {
        auto toi = compute_toi(ball, at(0, 3, 0), Vec3(10.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.state == TimeOfImpact::State::Separated);
    }

    SECTION("not moving") {
        auto toi = compute_toi(ball, at(0, 0, 0), vec3::ZERO, wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE_FALSE(toi.hit());
    }

    SECTION("already overlapping") {
        auto toi = compute_toi(ball, at(4.9f, 0, 0), Vec3(1.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.state == TimeOfImpact::State::Overlapping);
        REQUIRE(toi.t == 0.0f);
    }

    SECTION("degenerate shape") {
        const Shape flat = SphereShape{0.0f};
        auto toi = compute_toi(flat, at(0, 0, 0), Vec3(10.0f, 0.0f, 0.0f), wall, at(5, 0, 0), vec3::ZERO);
        REQUIRE(toi.state == TimeOfImpact::State::Failed);
    }
}

TEST_CASE("Sweep eligibility", "[physics][ccd]") {
    RigidBody fast(BodyId{1}, BodyBuilder().linear_velocity(Vec3(50.0f, 0.0f, 0.0f))
                                          .continuous().with_sphere(0.1f).build());
    REQUIRE(needs_sweep(fast, 2.0f));
    REQUIRE_FALSE(needs_sweep(fast, 100.0f));

    RigidBody discrete(BodyId{2}, BodyBuilder().linear_velocity(Vec3(50.0f, 0.0f, 0.0f))
                                              .with_sphere(0.1f).build());
    REQUIRE_FALSE(needs_sweep(discrete, 2.0f));

    RigidBody sensor(BodyId{3}, BodyBuilder().linear_velocity(Vec3(50.0f, 0.0f, 0.0f))
                                            .continuous().trigger().with_sphere(0.1f).build());
    REQUIRE_FALSE(needs_sweep(sensor, 2.0f));
}

// =============================================================================
// World Tests
// =============================================================================

TEST_CASE("Fast body tunnels without CCD", "[physics][ccd]") {
    BulletScene scene(false);
    for (int i = 0; i < 10; ++i) {
        scene.world.step_fixed();
    }
    REQUIRE(scene.world.body(scene.bullet)->position().x > 5.05f);
}

TEST_CASE("CCD stops a fast body at a thin wall", "[physics][ccd]") {
    BulletScene scene(true);

    std::uint32_t hits = 0;
    for (int i = 0; i < 10; ++i) {
        scene.world.step_fixed();
        hits += scene.world.stats().ccd_hits;
        REQUIRE(scene.world.body(scene.bullet)->position().x < 4.95f);
    }

    REQUIRE(hits >= 1);
    REQUIRE(scene.world.body(scene.bullet)->linear_velocity().x < 1.0f);
    REQUIRE(scene.world.body(scene.wall)->position() == Vec3(5.0f, 0.0f, 0.0f));
}

TEST_CASE("CCD stops box and capsule bullets at a thin wall", "[physics][ccd]") {
    const Shape projectile = GENERATE(Shape{BoxShape{Vec3(0.1f)}},
                                      Shape{CapsuleShape{0.1f, 0.2f, CapsuleAxis::Y}});
    BulletScene scene(true, projectile);

    std::uint32_t hits = 0;
    for (int i = 0; i < 10; ++i) {
        scene.world.step_fixed();
        hits += scene.world.stats().ccd_hits;
        REQUIRE(scene.world.body(scene.bullet)->position().x < 4.95f);
    }

    REQUIRE(hits >= 1);
    REQUIRE(scene.world.body(scene.bullet)->linear_velocity().x < 1.0f);
}

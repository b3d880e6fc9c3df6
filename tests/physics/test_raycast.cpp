// impulse_physics ray query tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/world.hpp>
#include <cmath>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

// =============================================================================
// Shape Raycast Tests
// =============================================================================

TEST_CASE("Raycast against single shapes", "[physics][query]") {
    const Ray ray(Vec3(-5.0f, 0.0f, 0.0f), vec3::X);
    const Transform origin{};

    SECTION("sphere") {
        auto hit = raycast_shape(SphereShape{1.0f}, origin, ray, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->first, WithinAbs(4.0f, 1e-4f));
        REQUIRE(approx_equal(hit->second, vec3::NEG_X, 1e-4f));
    }

    SECTION("rotated box") {
        const Transform turned{vec3::ZERO, quat_from_axis_angle(vec3::Y, consts::PI / 4.0f)};
        auto hit = raycast_shape(BoxShape{Vec3(1.0f)}, turned, ray, 100.0f);
        REQUIRE(hit.has_value());
        // The box edge points at the ray
        REQUIRE_THAT(hit->first, WithinAbs(5.0f - std::sqrt(2.0f), 1e-3f));
    }

    SECTION("capsule side") {
        auto hit = raycast_shape(CapsuleShape{0.5f, 1.0f}, origin, ray, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->first, WithinAbs(4.5f, 1e-4f));
    }

    SECTION("hull") {
        auto hit = raycast_shape(ConvexHullShape::box(Vec3(0.5f)), origin, ray, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->first, WithinAbs(4.5f, 1e-4f));
        REQUIRE(approx_equal(hit->second, vec3::NEG_X, 1e-4f));
    }

    SECTION("plane from above") {
        const Ray down(Vec3(0.0f, 3.0f, 0.0f), vec3::DOWN);
        auto hit = raycast_shape(PlaneShape::ground(1.0f), origin, down, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->first, WithinAbs(2.0f, 1e-5f));
        REQUIRE(approx_equal(hit->second, vec3::UP, 1e-5f));
    }

    SECTION("compound picks the nearest child") {
        CompoundShape pair;
        pair.add(SphereShape{0.5f}, Vec3(2.0f, 0.0f, 0.0f)).add(SphereShape{0.5f}, Vec3(-2.0f, 0.0f, 0.0f));
        auto hit = raycast_shape(pair, origin, ray, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE_THAT(hit->first, WithinAbs(2.5f, 1e-4f));
    }

    SECTION("beyond max distance") {
        REQUIRE_FALSE(raycast_shape(SphereShape{1.0f}, origin, ray, 3.0f).has_value());
    }

    SECTION("pointing away") {
        const Ray away(Vec3(-5.0f, 0.0f, 0.0f), vec3::NEG_X);
        REQUIRE_FALSE(raycast_shape(SphereShape{1.0f}, origin, away, 100.0f).has_value());
    }
}

// =============================================================================
// World Raycast Tests
// =============================================================================

namespace {

/// Three boxes along +X, a trigger in front of them and a ground plane
struct RayScene {
    PhysicsWorld world;
    BodyId near_box;
    BodyId mid_box;
    BodyId far_box;
    BodyId sensor;
    BodyId ground;

    RayScene() {
        near_box = world.create_body(BodyBuilder().static_body().position(3.0f, 1.0f, 0.0f)
                                                  .with_box(Vec3(0.5f))).unwrap();
        mid_box = world.create_body(BodyBuilder().static_body().position(6.0f, 1.0f, 0.0f)
                                                 .with_box(Vec3(0.5f)).layer(layers::Debris)).unwrap();
        far_box = world.create_body(BodyBuilder().static_body().position(9.0f, 1.0f, 0.0f)
                                                 .with_box(Vec3(0.5f))).unwrap();
        sensor = world.create_body(BodyBuilder().static_body().position(1.0f, 1.0f, 0.0f)
                                                .with_box(Vec3(0.25f)).trigger()).unwrap();
        ground = world.create_body(BodyBuilder().static_body().with_plane(vec3::UP, 0.0f)).unwrap();
    }
};

} // anonymous namespace

TEST_CASE("World raycast returns the closest hit", "[physics][query]") {
    RayScene scene;

    auto hit = scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE(hit->body == scene.near_box);
    REQUIRE_THAT(hit->distance, WithinAbs(2.5f, 1e-4f));
    REQUIRE_THAT(hit->fraction, WithinAbs(0.025f, 1e-6f));
    REQUIRE(approx_equal(hit->point, Vec3(2.5f, 1.0f, 0.0f), 1e-4f));
    REQUIRE(approx_equal(hit->normal, vec3::NEG_X, 1e-4f));
}

TEST_CASE("World raycast direction need not be unit length", "[physics][query]") {
    RayScene scene;
    auto hit = scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), Vec3(10.0f, 0.0f, 0.0f), 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE_THAT(hit->distance, WithinAbs(2.5f, 1e-4f));
}

TEST_CASE("World raycast misses", "[physics][query]") {
    RayScene scene;

    SECTION("empty direction") {
        REQUIRE_FALSE(scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::ZERO, 100.0f).has_value());
    }

    SECTION("too short") {
        REQUIRE_FALSE(scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 2.0f).has_value());
    }

    SECTION("zero max distance") {
        REQUIRE_FALSE(scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 0.0f).has_value());
    }

    SECTION("non-finite origin") {
        REQUIRE_FALSE(scene.world.raycast(Vec3(NAN, 1.0f, 0.0f), vec3::X, 100.0f).has_value());
    }

    SECTION("open sky") {
        REQUIRE_FALSE(scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::UP, 100.0f).has_value());
    }
}

TEST_CASE("World raycast filters", "[physics][query]") {
    RayScene scene;

    SECTION("triggers are skipped unless requested") {
        QueryFilter filter;
        filter.include_triggers = true;
        auto hit = scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f, filter);
        REQUIRE(hit.has_value());
        REQUIRE(hit->body == scene.sensor);
    }

    SECTION("layer mask") {
        QueryFilter filter;
        filter.layer_mask = layers::Debris;
        auto hit = scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f, filter);
        REQUIRE(hit.has_value());
        REQUIRE(hit->body == scene.mid_box);
    }

    SECTION("bodies without colliders are invisible") {
        const BodyId ghost = scene.world.create_body(BodyBuilder().static_body().position(0.5f, 1.0f, 0.0f)).unwrap();
        auto hit = scene.world.raycast(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->body != ghost);
    }
}

TEST_CASE("World raycast hits the ground plane", "[physics][query]") {
    RayScene scene;
    auto hit = scene.world.raycast(Vec3(20.0f, 5.0f, 0.0f), vec3::DOWN, 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE(hit->body == scene.ground);
    REQUIRE_THAT(hit->distance, WithinAbs(5.0f, 1e-5f));
}

TEST_CASE("raycast_all orders hits by distance", "[physics][query]") {
    RayScene scene;

    auto hits = scene.world.raycast_all(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f);
    REQUIRE(hits.size() == 3);
    REQUIRE(hits[0].body == scene.near_box);
    REQUIRE(hits[1].body == scene.mid_box);
    REQUIRE(hits[2].body == scene.far_box);
    REQUIRE(hits[0].distance < hits[1].distance);
    REQUIRE(hits[1].distance < hits[2].distance);

    SECTION("respects max distance") {
        auto short_hits = scene.world.raycast_all(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 6.0f);
        REQUIRE(short_hits.size() == 2);
    }

    SECTION("includes triggers on request") {
        QueryFilter filter;
        filter.include_triggers = true;
        auto all_hits = scene.world.raycast_all(Vec3(0.0f, 1.0f, 0.0f), vec3::X, 100.0f, filter);
        REQUIRE(all_hits.size() == 4);
        REQUIRE(all_hits[0].body == scene.sensor);
    }
}

TEST_CASE("Raycast sees moved bodies", "[physics][query]") {
    PhysicsWorld world;
    const BodyId ball = world.create_body(BodyBuilder().position(0.0f, 10.0f, 0.0f).with_sphere(0.5f)).unwrap();

    world.body(ball)->set_position(Vec3(5.0f, 0.0f, 0.0f));
    auto hit = world.raycast(vec3::ZERO, vec3::X, 100.0f);
    REQUIRE(hit.has_value());
    REQUIRE(hit->body == ball);
    REQUIRE_THAT(hit->distance, WithinAbs(4.5f, 1e-4f));
}

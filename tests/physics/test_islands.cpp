// impulse_physics island and sleep tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/world.hpp>
#include <impulse/physics/island.hpp>
#include <memory>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

/// Body arena in id order, with its index
struct Arena {
    std::vector<std::unique_ptr<RigidBody>> bodies;
    BodyIndexMap index;

    BodyId add(const RigidBodyDesc& desc) {
        const BodyId id{static_cast<std::uint64_t>(bodies.size() + 1)};
        index[id] = bodies.size();
        bodies.push_back(std::make_unique<RigidBody>(id, desc));
        return id;
    }
};

ContactManifold touching(BodyId a, BodyId b) {
    ContactManifold m;
    m.body_a = a;
    m.body_b = b;
    m.points.emplace_back();
    return m;
}

} // anonymous namespace

// =============================================================================
// Union Find Tests
// =============================================================================

TEST_CASE("UnionFind merges sets", "[physics][island]") {
    UnionFind sets;
    sets.reset(5);
    REQUIRE(sets.size() == 5);

    sets.unite(0, 1);
    sets.unite(3, 4);
    sets.unite(1, 4);

    REQUIRE(sets.find(0) == sets.find(3));
    REQUIRE(sets.find(2) != sets.find(0));
}

// =============================================================================
// Island Builder Tests
// =============================================================================

TEST_CASE("Islands split at static bodies", "[physics][island]") {
    Arena arena;
    const BodyId a = arena.add(RigidBodyDesc::dynamic_body());
    const BodyId b = arena.add(RigidBodyDesc::dynamic_body());
    const BodyId c = arena.add(RigidBodyDesc::dynamic_body());
    const BodyId d = arena.add(RigidBodyDesc::dynamic_body());
    const BodyId ground = arena.add(RigidBodyDesc::static_body());

    std::vector<ContactManifold> manifolds{
        touching(a, b),
        touching(c, ground),
        touching(d, ground),
    };

    // Triggers never link bodies
    ContactManifold sensor = touching(a, c);
    sensor.is_trigger = true;
    manifolds.push_back(sensor);

    IslandBuilder builder;
    builder.build(arena.bodies, arena.index, manifolds, {});

    const auto& islands = builder.islands();
    REQUIRE(islands.size() == 3);
    REQUIRE(islands[0].bodies == std::vector<std::size_t>{0, 1});
    REQUIRE(islands[0].manifolds == std::vector<std::size_t>{0});
    REQUIRE(islands[1].bodies == std::vector<std::size_t>{2});
    REQUIRE(islands[1].manifolds == std::vector<std::size_t>{1});
    REQUIRE(islands[2].bodies == std::vector<std::size_t>{3});
    REQUIRE(islands[2].manifolds == std::vector<std::size_t>{2});

    REQUIRE(builder.island_of(4) == IslandBuilder::k_no_island);
    REQUIRE(builder.island_of(1) == 0);
    REQUIRE(builder.sleeping_count() == 0);
}

TEST_CASE("Joints link islands", "[physics][island]") {
    Arena arena;
    const BodyId a = arena.add(RigidBodyDesc::dynamic_body(Vec3(0.0f)));
    const BodyId b = arena.add(RigidBodyDesc::dynamic_body(Vec3(2.0f, 0.0f, 0.0f)));

    std::vector<std::unique_ptr<IJointConstraint>> joints;
    joints.push_back(make_joint(JointId{1}, JointDesc::ball_socket(a, b, Vec3(1.0f, 0.0f, 0.0f)),
                                *arena.bodies[0], *arena.bodies[1]));

    IslandBuilder builder;
    builder.build(arena.bodies, arena.index, {}, joints);

    REQUIRE(builder.islands().size() == 1);
    REQUIRE(builder.islands()[0].bodies.size() == 2);
    REQUIRE(builder.islands()[0].joints == std::vector<std::size_t>{0});
}

// =============================================================================
// Sleep Tests
// =============================================================================

TEST_CASE("Island sleep timer", "[physics][island][sleep]") {
    Arena arena;
    arena.add(RigidBodyDesc::dynamic_body());
    arena.add(RigidBodyDesc::dynamic_body());

    Island island;
    island.bodies = {0, 1};

    SleepSettings settings;
    settings.time = 0.5f;

    SECTION("resting island falls asleep together") {
        for (int i = 0; i < 4; ++i) {
            REQUIRE_FALSE(update_island_sleep(island, arena.bodies, settings, 0.1f));
        }
        bool slept = false;
        for (int i = 0; i < 2 && !slept; ++i) {
            slept = update_island_sleep(island, arena.bodies, settings, 0.1f);
        }
        REQUIRE(slept);
        REQUIRE(island.sleeping);
        REQUIRE(arena.bodies[0]->is_sleeping());
        REQUIRE(arena.bodies[1]->is_sleeping());
    }

    SECTION("one moving member keeps the island awake") {
        arena.bodies[1]->set_linear_velocity(Vec3(1.0f, 0.0f, 0.0f));
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(update_island_sleep(island, arena.bodies, settings, 0.1f));
        }
        REQUIRE(arena.bodies[0]->sleep_timer() > 0.5f);
        REQUIRE(arena.bodies[1]->sleep_timer() == 0.0f);
    }

    SECTION("a member that may not sleep keeps the island awake") {
        arena.bodies[0]->set_can_sleep(false);
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(update_island_sleep(island, arena.bodies, settings, 0.1f));
        }
    }

    SECTION("disabled sleeping") {
        settings.enabled = false;
        for (int i = 0; i < 20; ++i) {
            REQUIRE_FALSE(update_island_sleep(island, arena.bodies, settings, 0.1f));
        }
    }
}

TEST_CASE("Mixed islands wake up", "[physics][island][sleep]") {
    Arena arena;
    arena.add(RigidBodyDesc::dynamic_body());
    arena.add(RigidBodyDesc::dynamic_body());
    arena.bodies[0]->sleep();

    std::vector<Island> islands(1);
    islands[0].bodies = {0, 1};

    REQUIRE(wake_mixed_islands(islands, arena.bodies) == 1);
    REQUIRE_FALSE(arena.bodies[0]->is_sleeping());

    // Fully asleep islands stay asleep
    arena.bodies[0]->sleep();
    arena.bodies[1]->sleep();
    islands[0].sleeping = true;
    REQUIRE(wake_mixed_islands(islands, arena.bodies) == 0);
    REQUIRE(arena.bodies[0]->is_sleeping());
}

// =============================================================================
// World Sleep Tests
// =============================================================================

TEST_CASE("Resting body falls asleep on the ground", "[physics][island][sleep]") {
    PhysicsWorld world;
    REQUIRE(world.create_body(BodyBuilder().static_body().with_plane(vec3::UP, 0.0f)).is_ok());
    const BodyId ball = world.create_body(BodyBuilder().position(0.0f, 1.0f, 0.0f).with_sphere(0.5f)).unwrap();

    for (int i = 0; i < 360; ++i) {
        world.step_fixed();
    }

    const RigidBody* body = world.body(ball);
    REQUIRE(body->is_sleeping());
    REQUIRE(body->is_grounded());
    REQUIRE(body->linear_velocity() == vec3::ZERO);
    REQUIRE_THAT(body->position().y, WithinAbs(0.5f, 0.02f));
    REQUIRE(world.stats().sleeping_bodies == 1);

    SECTION("a sleeping body does not move") {
        const Vec3 before = body->position();
        world.step_fixed();
        REQUIRE(world.body(ball)->position() == before);
    }

    SECTION("wake_body resumes simulation") {
        REQUIRE(world.wake_body(ball).is_ok());
        REQUIRE_FALSE(world.body(ball)->is_sleeping());
    }

    SECTION("a new impact wakes it") {
        REQUIRE(world.create_body(BodyBuilder().position(0.0f, 1.6f, 0.0f)
                                               .linear_velocity(Vec3(0.0f, -3.0f, 0.0f))
                                               .with_sphere(0.5f)).is_ok());
        for (int i = 0; i < 10; ++i) {
            world.step_fixed();
        }
        REQUIRE_FALSE(world.body(ball)->is_sleeping());
    }
}

TEST_CASE("sleep_body puts a body to sleep", "[physics][island][sleep]") {
    PhysicsWorld world;
    const BodyId ball = world.create_body(BodyBuilder().position(0.0f, 10.0f, 0.0f).with_sphere(0.5f)).unwrap();

    REQUIRE(world.sleep_body(ball).is_ok());
    REQUIRE(world.body(ball)->is_sleeping());

    world.step_fixed();
    REQUIRE(world.body(ball)->position().y == 10.0f);

    REQUIRE(world.sleep_body(BodyId{42}).is_err());
    REQUIRE(world.wake_body(BodyId{42}).is_err());
}

TEST_CASE("Bodies created asleep stay put", "[physics][island][sleep]") {
    PhysicsWorld world;
    const BodyId ball = world.create_body(
        BodyBuilder().position(0.0f, 10.0f, 0.0f).start_asleep().with_sphere(0.5f)).unwrap();

    for (int i = 0; i < 10; ++i) {
        world.step_fixed();
    }
    REQUIRE(world.body(ball)->position().y == 10.0f);
}

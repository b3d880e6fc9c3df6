// impulse_physics spatial hash broadphase tests

#include <catch2/catch_test_macros.hpp>
#include <impulse/physics/broadphase.hpp>
#include <algorithm>
#include <vector>

using namespace impulse_physics;
using namespace impulse_math;

namespace {

BroadphaseProxy make_proxy(std::uint64_t id, const Vec3& center, float half = 0.5f) {
    BroadphaseProxy proxy;
    proxy.body = BodyId{id};
    proxy.bounds = AABB::from_center_half_extents(center, splat3(half));
    return proxy;
}

} // anonymous namespace

// =============================================================================
// Pair Tests
// =============================================================================

TEST_CASE("BodyPair ordering", "[physics][broadphase]") {
    BodyPair p = BodyPair::make(BodyId{7}, BodyId{3});
    REQUIRE(p.body_a == BodyId{3});
    REQUIRE(p.body_b == BodyId{7});
    REQUIRE(p == BodyPair::make(BodyId{3}, BodyId{7}));
    REQUIRE(BodyPair::make(BodyId{1}, BodyId{9}) < p);
}

TEST_CASE("Broadphase pair filtering", "[physics][broadphase]") {
    BroadphaseProxy a = make_proxy(1, vec3::ZERO);
    BroadphaseProxy b = make_proxy(2, vec3::ZERO);

    SECTION("two dynamic proxies") {
        REQUIRE(SpatialHashGrid::should_test(a, b));
    }

    SECTION("a proxy never pairs with itself") {
        REQUIRE_FALSE(SpatialHashGrid::should_test(a, a));
    }

    SECTION("immovable pairs are skipped") {
        a.immovable = true;
        REQUIRE(SpatialHashGrid::should_test(a, b));
        b.immovable = true;
        REQUIRE_FALSE(SpatialHashGrid::should_test(a, b));
    }

    SECTION("sleeping pairs are skipped") {
        a.sleeping = true;
        b.sleeping = true;
        REQUIRE_FALSE(SpatialHashGrid::should_test(a, b));
    }

    SECTION("layer masks must agree both ways") {
        a.mask.layer = layers::Projectile;
        a.mask.collides_with = layers::Static;
        b.mask.layer = layers::Dynamic;
        REQUIRE_FALSE(SpatialHashGrid::should_test(a, b));

        b.mask.layer = layers::Static;
        b.mask.collides_with = layers::All;
        REQUIRE(SpatialHashGrid::should_test(a, b));

        b.mask.collides_with = layers::Dynamic;
        REQUIRE_FALSE(SpatialHashGrid::should_test(a, b));
    }
}

// =============================================================================
// Grid Tests
// =============================================================================

TEST_CASE("Spatial hash finds overlapping pairs", "[physics][broadphase]") {
    SpatialHashGrid grid(2.0f);

    grid.insert(make_proxy(1, Vec3(0.0f, 0.0f, 0.0f)));
    grid.insert(make_proxy(2, Vec3(0.8f, 0.0f, 0.0f)));   // Overlaps 1
    grid.insert(make_proxy(3, Vec3(10.0f, 0.0f, 0.0f)));  // Alone
    grid.insert(make_proxy(4, Vec3(1.7f, 0.1f, 0.0f)));   // Overlaps 2 across a cell border

    REQUIRE(grid.proxy_count() == 4);

    auto pairs = grid.find_pairs();
    REQUIRE(pairs.size() == 2);
    REQUIRE(pairs[0] == BodyPair::make(BodyId{1}, BodyId{2}));
    REQUIRE(pairs[1] == BodyPair::make(BodyId{2}, BodyId{4}));
    REQUIRE(std::is_sorted(pairs.begin(), pairs.end()));
}

TEST_CASE("Spatial hash reports each pair once", "[physics][broadphase]") {
    SpatialHashGrid grid(1.0f);

    // Both proxies span many shared cells
    grid.insert(make_proxy(1, vec3::ZERO, 3.0f));
    grid.insert(make_proxy(2, Vec3(0.5f), 3.0f));

    auto pairs = grid.find_pairs();
    REQUIRE(pairs.size() == 1);
}

TEST_CASE("Spatial hash handles huge proxies", "[physics][broadphase]") {
    SpatialHashGrid grid(2.0f);

    BroadphaseProxy ground;
    ground.body = BodyId{1};
    ground.bounds = AABB(splat3(-1e10f), splat3(1e10f));
    ground.immovable = true;
    grid.insert(ground);

    grid.insert(make_proxy(2, Vec3(100.0f, 1.0f, -40.0f)));
    grid.insert(make_proxy(3, Vec3(-3.0f, 2.0f, 5.0f)));

    auto pairs = grid.find_pairs();
    REQUIRE(pairs.size() == 2);
    REQUIRE(pairs[0] == BodyPair::make(BodyId{1}, BodyId{2}));
    REQUIRE(pairs[1] == BodyPair::make(BodyId{1}, BodyId{3}));
}

TEST_CASE("Spatial hash region query", "[physics][broadphase]") {
    SpatialHashGrid grid(2.0f);
    grid.insert(make_proxy(1, Vec3(0.0f)));
    grid.insert(make_proxy(2, Vec3(5.0f, 0.0f, 0.0f)));
    grid.insert(make_proxy(3, Vec3(9.0f, 0.0f, 0.0f)));

    std::vector<BodyId> found;
    grid.query(AABB(Vec3(-1.0f), Vec3(6.0f, 1.0f, 1.0f)), found);
    REQUIRE(found.size() == 2);
    REQUIRE(found[0] == BodyId{1});
    REQUIRE(found[1] == BodyId{2});

    SECTION("clear empties the grid") {
        grid.clear();
        REQUIRE(grid.proxy_count() == 0);
        REQUIRE(grid.cell_count() == 0);
        grid.query(AABB(Vec3(-100.0f), Vec3(100.0f)), found);
        REQUIRE(found.empty());
    }
}

TEST_CASE("Spatial hash flat proxies", "[physics][broadphase]") {
    SpatialHashGrid grid(2.0f);

    // Zero-thickness bounds still overlap what touches them
    BroadphaseProxy sheet;
    sheet.body = BodyId{1};
    sheet.bounds = AABB(Vec3(-1.0f, 0.0f, -1.0f), Vec3(1.0f, 0.0f, 1.0f));
    grid.insert(sheet);
    grid.insert(make_proxy(2, Vec3(0.0f, 0.5f, 0.0f)));

    REQUIRE(grid.find_pairs().size() == 1);
}

// impulse_physics joint tests

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <impulse/physics/world.hpp>
#include <algorithm>
#include <cmath>

using namespace impulse_physics;
using namespace impulse_math;
using Catch::Matchers::WithinAbs;

namespace {

/// Collider-less static anchor
BodyId make_anchor(PhysicsWorld& world, const Vec3& position) {
    return world.create_body(BodyBuilder().static_body().position(position)).unwrap();
}

void run(PhysicsWorld& world, float seconds) {
    const int steps = static_cast<int>(seconds / world.config().fixed_dt);
    for (int i = 0; i < steps; ++i) {
        world.step_fixed();
    }
}

} // anonymous namespace

// =============================================================================
// Descriptor Tests
// =============================================================================

TEST_CASE("JointDesc validation", "[physics][joint]") {
    const BodyId a{1};
    const BodyId b{2};

    REQUIRE(JointDesc::ball_socket(a, b, vec3::ZERO).validate().is_ok());
    REQUIRE(JointDesc::hinge(a, b, vec3::ZERO, vec3::Z).with_limits(-1.0f, 1.0f).validate().is_ok());

    SECTION("self joint") {
        auto result = JointDesc::fixed(a, a, vec3::ZERO).validate();
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<impulse_core::PhysicsError>());
    }

    SECTION("unset body") {
        REQUIRE(JointDesc::ball_socket(BodyId{}, b, vec3::ZERO).validate().is_err());
    }

    SECTION("non-unit axis") {
        REQUIRE(JointDesc::slider(a, b, vec3::ZERO, Vec3(0.0f, 2.0f, 0.0f)).validate().is_err());
    }

    SECTION("inverted limits") {
        REQUIRE(JointDesc::hinge(a, b, vec3::ZERO, vec3::Y).with_limits(1.0f, -1.0f).validate().is_err());
    }

    SECTION("negative distance range") {
        REQUIRE(JointDesc::distance(a, b, vec3::ZERO, vec3::X).with_limits(-1.0f, 2.0f).validate().is_err());
    }

    SECTION("non-finite anchor") {
        REQUIRE(JointDesc::ball_socket(a, b, Vec3(NAN, 0.0f, 0.0f)).validate().is_err());
    }

    SECTION("softness range") {
        REQUIRE(JointDesc::ball_socket(a, b, vec3::ZERO).with_softness(0.1f).validate().is_ok());
        REQUIRE(JointDesc::ball_socket(a, b, vec3::ZERO).with_softness(0.0f).validate().is_err());
        REQUIRE(JointDesc::ball_socket(a, b, vec3::ZERO).with_softness(1.5f).validate().is_err());
        REQUIRE(JointDesc::ball_socket(a, b, vec3::ZERO).with_softness(0.5f, -1.0f).validate().is_err());
    }
}

TEST_CASE("World joint management", "[physics][joint]") {
    PhysicsWorld world;
    const BodyId anchor = make_anchor(world, Vec3(0.0f, 5.0f, 0.0f));
    const BodyId bob = world.create_body(BodyBuilder().position(2.0f, 5.0f, 0.0f).with_sphere(0.25f)).unwrap();

    SECTION("create and remove") {
        auto id = world.create_joint(JointDesc::ball_socket(anchor, bob, Vec3(0.0f, 5.0f, 0.0f)));
        REQUIRE(id.is_ok());
        REQUIRE(world.joint_count() == 1);
        REQUIRE(world.joint(id.value()) != nullptr);
        REQUIRE(world.joint(id.value())->type() == JointType::BallSocket);

        REQUIRE(world.remove_joint(id.value()).is_ok());
        REQUIRE(world.joint_count() == 0);
        REQUIRE(world.remove_joint(id.value()).is_err());
    }

    SECTION("unknown body") {
        auto id = world.create_joint(JointDesc::ball_socket(anchor, BodyId{99}, vec3::ZERO));
        REQUIRE(id.is_err());
        REQUIRE(id.error().is<impulse_core::PhysicsError>());
        REQUIRE(world.joint_count() == 0);
    }

    SECTION("removing a body removes its joints") {
        REQUIRE(world.create_joint(JointDesc::ball_socket(anchor, bob, Vec3(0.0f, 5.0f, 0.0f))).is_ok());
        REQUIRE(world.remove_body(bob).is_ok());
        REQUIRE(world.joint_count() == 0);
    }
}

// =============================================================================
// Behavior Tests
// =============================================================================

TEST_CASE("Softer joints correct drift more slowly", "[physics][joint]") {
    PhysicsWorldConfig config;
    config.gravity = vec3::ZERO;

    // Anchor error left after one step when the bob is pulled 0.3 m off its joint
    const auto error_after_step = [&config](float correction) {
        PhysicsWorld world(config);
        const BodyId anchor = make_anchor(world, Vec3(0.0f, 5.0f, 0.0f));
        const BodyId bob = world.create_body(BodyBuilder().position(2.0f, 5.0f, 0.0f).with_sphere(0.25f)).unwrap();
        const JointId joint = world.create_joint(
            JointDesc::ball_socket(anchor, bob, Vec3(0.0f, 5.0f, 0.0f)).with_softness(correction)).unwrap();
        REQUIRE_THAT(world.joint(joint)->softness().correction, WithinAbs(correction, 1e-6f));

        world.body(bob)->set_position(Vec3(2.3f, 5.0f, 0.0f));
        world.step_fixed();
        return std::abs(world.body(bob)->position().x - 2.0f);
    };

    const float stiff = error_after_step(0.5f);
    const float soft = error_after_step(0.1f);

    REQUIRE(stiff < 0.1f);
    REQUIRE(soft > 0.15f);
    REQUIRE(soft < 0.3f);
}

TEST_CASE("Ball socket pendulum keeps its length", "[physics][joint]") {
    PhysicsWorld world;
    const Vec3 pivot(0.0f, 5.0f, 0.0f);
    const BodyId anchor = make_anchor(world, pivot);
    const BodyId bob = world.create_body(
        BodyBuilder().position(2.0f, 5.0f, 0.0f).with_sphere(0.25f).linear_damping(0.0f)).unwrap();
    REQUIRE(world.create_joint(JointDesc::ball_socket(anchor, bob, pivot)).is_ok());

    float lowest = 5.0f;
    for (int i = 0; i < 240; ++i) {
        world.step_fixed();
        const Vec3 p = world.body(bob)->position();
        REQUIRE_THAT(length(p - pivot), WithinAbs(2.0f, 0.05f));
        lowest = std::min(lowest, p.y);
    }

    // It actually swung
    REQUIRE(lowest < 3.5f);
}

TEST_CASE("Distance joint holds its rest length", "[physics][joint]") {
    PhysicsWorld world;
    const Vec3 pivot(0.0f, 5.0f, 0.0f);
    const BodyId anchor = make_anchor(world, pivot);
    const BodyId bob = world.create_body(
        BodyBuilder().position(0.0f, 3.0f, 0.0f).linear_velocity(Vec3(3.0f, 0.0f, 0.0f)).with_sphere(0.2f)).unwrap();

    auto id = world.create_joint(JointDesc::distance(anchor, bob, pivot, Vec3(0.0f, 3.0f, 0.0f)));
    REQUIRE(id.is_ok());
    const auto* joint = dynamic_cast<const DistanceJoint*>(world.joint(id.value()));
    REQUIRE(joint != nullptr);
    REQUIRE_THAT(joint->rest_length(), WithinAbs(2.0f, 1e-6f));

    run(world, 1.5f);
    REQUIRE_THAT(length(world.body(bob)->position() - pivot), WithinAbs(2.0f, 0.05f));
    REQUIRE_THAT(joint->current_length(), WithinAbs(2.0f, 0.05f));
}

TEST_CASE("Distance joint range acts as a rope", "[physics][joint]") {
    PhysicsWorld world;
    const Vec3 pivot(0.0f, 5.0f, 0.0f);
    const BodyId anchor = make_anchor(world, pivot);
    const BodyId bob = world.create_body(BodyBuilder().position(0.0f, 4.0f, 0.0f).with_sphere(0.2f)).unwrap();

    REQUIRE(world.create_joint(
        JointDesc::distance(anchor, bob, pivot, Vec3(0.0f, 4.0f, 0.0f)).with_limits(0.0f, 3.0f)).is_ok());

    // Slack rope lets the bob fall freely at first
    run(world, 0.2f);
    REQUIRE(world.body(bob)->position().y < 3.9f);

    run(world, 2.0f);
    REQUIRE_THAT(world.body(bob)->position().y, WithinAbs(2.0f, 0.05f));
}

TEST_CASE("Hinge limits stop the swing", "[physics][joint]") {
    PhysicsWorld world;
    const Vec3 pivot(0.0f, 5.0f, 0.0f);
    const BodyId anchor = make_anchor(world, pivot);
    const BodyId arm = world.create_body(
        BodyBuilder().position(1.0f, 5.0f, 0.0f).with_box(Vec3(0.5f, 0.1f, 0.1f))).unwrap();

    auto id = world.create_joint(JointDesc::hinge(anchor, arm, pivot, vec3::Z).with_limits(-0.5f, 0.5f));
    REQUIRE(id.is_ok());
    const auto* hinge = dynamic_cast<const HingeJoint*>(world.joint(id.value()));
    REQUIRE(hinge != nullptr);

    run(world, 2.0f);

    const RigidBody* a = world.body(anchor);
    const RigidBody* b = world.body(arm);
    const float angle = hinge->compute_angle(a->rotation(), b->rotation());

    // Gravity turns the arm clockwise about +Z, down to the lower limit
    REQUIRE_THAT(angle, WithinAbs(-0.5f, 0.05f));
    REQUIRE_THAT(hinge->angle(), WithinAbs(-0.5f, 0.05f));

    // Pivot stays attached and the arm stays in its plane
    REQUIRE_THAT(length(b->position() - pivot), WithinAbs(1.0f, 0.05f));
    REQUIRE_THAT(b->position().z, WithinAbs(0.0f, 0.01f));
}

TEST_CASE("Slider limits stop the travel", "[physics][joint]") {
    PhysicsWorld world;
    const BodyId rail = make_anchor(world, vec3::ZERO);
    const BodyId carriage = world.create_body(
        BodyBuilder().position(0.0f, 3.0f, 0.0f).linear_velocity(Vec3(2.0f, 0.0f, 0.0f))
                     .with_box(Vec3(0.2f))).unwrap();

    auto id = world.create_joint(
        JointDesc::slider(rail, carriage, Vec3(0.0f, 3.0f, 0.0f), vec3::Y).with_limits(-1.0f, 0.5f));
    REQUIRE(id.is_ok());
    const auto* slider = dynamic_cast<const SliderJoint*>(world.joint(id.value()));
    REQUIRE(slider != nullptr);

    run(world, 2.0f);

    const RigidBody* b = world.body(carriage);
    // Off-axis motion is removed and travel stops at the lower limit
    REQUIRE_THAT(b->position().x, WithinAbs(0.0f, 0.02f));
    REQUIRE_THAT(b->position().y, WithinAbs(2.0f, 0.05f));
    REQUIRE_THAT(slider->translation(), WithinAbs(-1.0f, 0.05f));
    REQUIRE(approx_equal(b->rotation(), quat::IDENTITY, 1e-2f));
}

TEST_CASE("Fixed joint holds a cantilever", "[physics][joint]") {
    PhysicsWorld world;
    const BodyId wall = make_anchor(world, vec3::ZERO);
    const BodyId beam = world.create_body(
        BodyBuilder().position(1.0f, 0.0f, 0.0f).with_box(Vec3(0.5f, 0.1f, 0.1f))).unwrap();

    REQUIRE(world.create_joint(JointDesc::fixed(wall, beam, Vec3(0.5f, 0.0f, 0.0f))).is_ok());

    run(world, 1.0f);

    const RigidBody* b = world.body(beam);
    REQUIRE(approx_equal(b->position(), Vec3(1.0f, 0.0f, 0.0f), 0.05f));
    REQUIRE(approx_equal(b->rotation(), quat::IDENTITY, 0.05f));
}

TEST_CASE("Ball socket chain between dynamic bodies", "[physics][joint]") {
    PhysicsWorld world;
    const Vec3 pivot(0.0f, 10.0f, 0.0f);
    const BodyId anchor = make_anchor(world, pivot);
    const BodyId first = world.create_body(BodyBuilder().position(0.0f, 9.0f, 0.0f).with_sphere(0.2f)).unwrap();
    const BodyId second = world.create_body(
        BodyBuilder().position(1.0f, 9.0f, 0.0f).with_sphere(0.2f)).unwrap();

    REQUIRE(world.create_joint(JointDesc::ball_socket(anchor, first, pivot)).is_ok());
    REQUIRE(world.create_joint(JointDesc::ball_socket(first, second, Vec3(0.0f, 9.0f, 0.0f))).is_ok());

    run(world, 1.0f);

    const Vec3 p1 = world.body(first)->position();
    const Vec3 p2 = world.body(second)->position();
    REQUIRE_THAT(length(p1 - pivot), WithinAbs(1.0f, 0.05f));
    REQUIRE_THAT(length(p2 - p1), WithinAbs(1.0f, 0.05f));

    // Jointed bodies share one island; the static anchor joins none
    bool shared = false;
    for (const auto& island : world.islands()) {
        shared = shared || island.bodies.size() == 2;
    }
    REQUIRE(shared);
}

/// @file types.cpp
/// @brief Enum names used in log messages

#include <impulse/physics/types.hpp>

namespace impulse_physics {

const char* to_string(BodyType type) {
    switch (type) {
        case BodyType::Static: return "static";
        case BodyType::Kinematic: return "kinematic";
        case BodyType::Dynamic: return "dynamic";
    }
    return "?";
}

const char* to_string(CcdMode mode) {
    return mode == CcdMode::Swept ? "swept" : "discrete";
}

const char* to_string(ShapeType type) {
    switch (type) {
        case ShapeType::Sphere: return "sphere";
        case ShapeType::Aabb: return "aabb";
        case ShapeType::Box: return "box";
        case ShapeType::Capsule: return "capsule";
        case ShapeType::ConvexHull: return "convex_hull";
        case ShapeType::Plane: return "plane";
        case ShapeType::Compound: return "compound";
    }
    return "?";
}

const char* to_string(CapsuleAxis axis) {
    static constexpr const char* names[] = {"x", "y", "z"};
    const auto index = static_cast<std::size_t>(axis);
    return index < 3 ? names[index] : "?";
}

const char* to_string(JointType type) {
    switch (type) {
        case JointType::BallSocket: return "ball_socket";
        case JointType::Distance: return "distance";
        case JointType::Hinge: return "hinge";
        case JointType::Fixed: return "fixed";
        case JointType::Slider: return "slider";
    }
    return "?";
}

} // namespace impulse_physics

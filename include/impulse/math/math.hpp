#pragma once

/// @file math.hpp
/// @brief All of impulse_math: GLM aliases, orientation and tensor helpers,
/// rigid transforms, bounds and ray tests

#include "types.hpp"
#include "vec.hpp"
#include "quat.hpp"
#include "mat.hpp"
#include "transform.hpp"
#include "bounds.hpp"
#include "intersect.hpp"

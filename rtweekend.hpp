#pragma once

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>

//c++ std usings
using std::make_shared;
using std::shared_ptr;

//constants
constexpr double infinity = std::numeric_limits<double>::infinity();
constexpr double pi = 3.14159265358979323846;

//tolerance used to match a hit point against a cube boundary
constexpr double face_epsilon = 1e-4;
//offset of a shadow ray origin along the surface normal
constexpr double shadow_bias = 1e-4;

//utility functions

//true if a and b differ by less than eps
inline bool nearly_equal(double a, double b, double eps = face_epsilon) {
	return std::fabs(a - b) < eps;
}

//common headers
#include "vec3.hpp"
#include "interval.hpp"
#include "color.hpp"
#include "ray.hpp"

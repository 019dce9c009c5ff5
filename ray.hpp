#pragma once

#include "vec3.hpp"

class ray {
public:
	point3 orig;
	vec3 dir;

	//default constructor
	ray() {}

	//parametric constructor, direction is expected to be unit length
	ray(const point3& origin, const vec3& direction)
		: orig(origin)
		, dir(direction) {}

	//getters
	const point3& origin() const { return orig; }
	const vec3& direction() const { return dir; }

	//return the point at distance t along the ray
	point3 at(double t) const { return orig + t * dir; }
};

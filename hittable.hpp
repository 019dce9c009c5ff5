#pragma once

#include "material.hpp"

#include <optional>

//which texture slot of a cube a hit landed on
enum class cube_face {
	top,
	bottom,
	side,       //left and right (x planes)
	front_back  //z planes, drawn with the side texture
};

//holds information about the intersection between a ray and an object
class hit_record {
public:
	point3 p;         //intersection point
	vec3 normal;      //outward normal at the intersection point
	double t = 0.0;                 //distance along the ray to the intersection point
	material mat;                   //material in effect, diffuse taken from the texture
	double u = 0.0;                 //u texture coordinate
	double v = 0.0;                 //v texture coordinate
	cube_face face = cube_face::top; //face the texture was sampled from
};

//virtual abstract class for hittable objects
class hittable {
public:
	virtual ~hittable() = default;
	//empty optional means the ray misses, r.direction() must be unit length
	virtual std::optional<hit_record> hit(const ray& r) const = 0;
};

#pragma once

#include "rtweekend.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

//orbiting look-at camera
class camera {
public:
	//pitch stays this far away from the poles
	static constexpr double pole_margin = 0.1;
	//eye never gets closer than this to the target
	static constexpr double min_distance = 0.5;

	camera(const point3& lookfrom, const point3& lookat, const vec3& vup)
		: lookfrom(lookfrom)
		, lookat(lookat)
		, vup(vup)
	{
		if ((lookfrom - lookat).length() < 1e-8) {
			throw std::invalid_argument("camera: eye and target coincide");
		}
		update_basis();
	}

	const point3& eye() const { return lookfrom; }
	const point3& target() const { return lookat; }
	double distance() const { return (lookfrom - lookat).length(); }

	//camera frame basis vectors: right, up, backward (the view looks down -w)
	const vec3& right() const { return u; }
	const vec3& true_up() const { return v; }
	const vec3& backward() const { return w; }

	//camera space direction (x right, y up, -z into the scene) to world space
	vec3 base_change(const vec3& direction) const {
		return unit_vector(direction.x() * u + direction.y() * v + direction.z() * w);
	}

	//rotate the eye around the target, yaw about world y, keeps the distance
	void orbit(double delta_yaw, double delta_pitch) {
		vec3 radius_vector = lookfrom - lookat;
		double radius = radius_vector.length();

		double current_yaw = std::atan2(radius_vector.z(), radius_vector.x());
		double radius_xz = std::sqrt(radius_vector.x() * radius_vector.x() + radius_vector.z() * radius_vector.z());
		double current_pitch = std::atan2(radius_vector.y(), radius_xz);

		double new_yaw = current_yaw + delta_yaw;
		double new_pitch = current_pitch;
		//only a pitch change is kept away from the poles
		if (delta_pitch != 0.0) {
			new_pitch = std::clamp(current_pitch + delta_pitch, -pi / 2 + pole_margin, pi / 2 - pole_margin);
		}

		lookfrom = lookat + vec3(
			radius * std::cos(new_yaw) * std::cos(new_pitch),
			radius * std::sin(new_pitch),
			radius * std::sin(new_yaw) * std::cos(new_pitch)
		);

		update_basis();
	}

	//move the eye along the eye -> target axis, positive delta moves closer
	void zoom(double delta) {
		vec3 direction = unit_vector(lookat - lookfrom);
		double new_distance = std::max(distance() - delta, min_distance);

		lookfrom = lookat - new_distance * direction;

		update_basis();
	}

private:
	point3 lookfrom; //point where camera is looking from
	point3 lookat;   //point where camera is looking at
	vec3 vup;        //camera-relative "up" direction
	vec3 u, v, w;    //camera frame basis vectors

	void update_basis() {
		w = unit_vector(lookfrom - lookat);

		//an up vector along the view axis has no usable cross product
		vec3 up_hint = vup;
		if (cross(up_hint, w).near_zero()) {
			up_hint = vec3(0, 0, 1);
			if (cross(up_hint, w).near_zero()) {
				up_hint = vec3(1, 0, 0);
			}
		}

		u = unit_vector(cross(up_hint, w));
		v = cross(w, u);
	}
};

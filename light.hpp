#pragma once

#include "hittable_list.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

//point light
struct light {
	point3 position;
	color col;
	double intensity;

	light() : intensity(0.0) {}
	light(const point3& position, const color& col, double intensity)
		: position(position)
		, col(col)
		, intensity(intensity)
	{}
};

//how much of the light is blocked at point, in [0, 1]
//only the first occluder in list order counts, a nearer blocker gives a darker shadow
inline double cast_shadow(const point3& point, const vec3& normal, const light& l, const hittable_list& objects) {
	vec3 to_light = l.position - point;
	double light_distance = to_light.length();
	vec3 light_dir = unit_vector(to_light);

	//push the origin off the surface, to the side facing the light
	vec3 offset_normal = normal * shadow_bias;
	point3 shadow_ray_origin = dot(light_dir, normal) < 0.0
		? point - offset_normal
		: point + offset_normal;
	ray shadow_ray(shadow_ray_origin, light_dir);

	for (const auto& object : objects.objects) {
		auto rec = object->hit(shadow_ray);
		if (rec && rec->t < light_distance) {
			double distance_ratio = rec->t / light_distance;
			return 1.0 - std::min(distance_ratio * distance_ratio, 1.0);
		}
	}
	return 0.0;
}

//diffuse + specular from every light, shadowed by objects
//the sum is left unclamped, packing saturates it
inline color calculate_lighting(const point3& point, const vec3& normal, const vec3& view_dir,
	const material& mat, const std::vector<light>& lights, const hittable_list& objects) {
	color final_color(0, 0, 0);

	for (const auto& l : lights) {
		double shadow_intensity = cast_shadow(point, normal, l, objects);
		double light_intensity = l.intensity * (1.0 - shadow_intensity);

		vec3 light_dir = unit_vector(l.position - point);
		vec3 reflect_dir = reflect(-light_dir, normal);

		double diffuse_intensity = std::max(dot(normal, light_dir), 0.0);
		color diffuse = mat.diffuse.scale(diffuse_intensity * mat.albedo[0]) * light_intensity;

		double specular_intensity = std::pow(std::max(dot(reflect_dir, view_dir), 0.0), mat.specular);
		color specular = color(255, 255, 255).scale(specular_intensity * mat.albedo[1]) * light_intensity;

		final_color += diffuse + specular;
	}

	return final_color;
}

//schlick approximation, f0 at normal incidence rising to 1 at grazing angles
inline double fresnel_effect(const vec3& normal, const vec3& view_dir, double f0) {
	double cos_theta = std::max(dot(normal, view_dir), 0.0);
	return f0 + (1.0 - f0) * std::pow(1.0 - cos_theta, 5);
}

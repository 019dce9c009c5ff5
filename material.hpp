#pragma once

#include "rtweekend.hpp"

//surface response of a cube, copied by value into every hit record
class material {
public:
	double albedo[2];     //weights of the diffuse [0] and specular [1] terms
	double specular;      //phong exponent
	double transparency;  //reserved, not used by the shading
	double reflectivity;  //fresnel base reflectance f0, also the blend weight
	color diffuse;        //base color, replaced by the texel on every hit
	color fresnel_color;  //tint blended in at grazing angles

	material()
		: albedo{ 1.0, 0.0 }
		, specular(0.0)
		, transparency(0.0)
		, reflectivity(0.0)
		, diffuse(255, 255, 255)
		, fresnel_color(255, 255, 255)
	{}

	material(double diffuse_weight, double specular_weight, double specular, double transparency,
		double reflectivity, const color& diffuse, const color& fresnel_color)
		: albedo{ diffuse_weight, specular_weight }
		, specular(specular)
		, transparency(transparency)
		, reflectivity(reflectivity)
		, diffuse(diffuse)
		, fresnel_color(fresnel_color)
	{}

	//same material with the diffuse color overridden (texture lookup)
	material with_diffuse(const color& c) const {
		material m = *this;
		m.diffuse = c;
		return m;
	}
};

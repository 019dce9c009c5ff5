#pragma once

#include "light.hpp"

#include <cmath>
#include <vector>

//day / night cycle driving the sun, the moon and the glowstone light
struct DayCycle {
	double time = 0.0;
	double time_step = 0.1; //advance per frame

	//sun orbit
	double orbit_x = 15.0;
	double orbit_y = 25.0;
	double orbit_z = 15.0;

	color sun_color = color(255, 255, 224);
	double sun_intensity = 1.0;
	color moon_color = color(135, 206, 235);
	double moon_intensity = 0.5;

	//secondary light inside the glowstone block, on at night only
	point3 glowstone_position = point3(7.0, 6.375, -7.125);
	color glowstone_color = color(255, 223, 0);
	double glowstone_intensity = 0.01;

	void advance() {
		time += time_step;
	}

	//angle of the sun in [0, 2pi)
	double sun_angle() const {
		return std::fmod(time, 2.0 * pi);
	}

	bool is_night() const {
		return sun_angle() >= pi;
	}

	point3 sun_position() const {
		return orbit_point(sun_angle());
	}

	point3 moon_position() const {
		return orbit_point(std::fmod(sun_angle() + pi, 2.0 * pi));
	}

	//lights in effect for the current time
	std::vector<light> lights() const {
		std::vector<light> result;

		if (!is_night()) {
			result.emplace_back(sun_position(), sun_color, sun_intensity);
		}
		else {
			result.emplace_back(moon_position(), moon_color, moon_intensity);
			result.emplace_back(glowstone_position, glowstone_color, glowstone_intensity);
		}
		return result;
	}

private:
	point3 orbit_point(double angle) const {
		return point3(orbit_x * std::cos(angle), orbit_y * std::sin(angle), orbit_z);
	}
};

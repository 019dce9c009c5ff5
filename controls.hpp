#pragma once

#include "camera.hpp"

#include <stdexcept>
#include <string>
#include <vector>

//camera keys of the viewer
enum class key {
	left,     //L
	right,    //R
	up,       //U
	down,     //D
	zoom_in,  //X
	zoom_out  //Z
};

//turn a script such as "LLUX" into keys, one per frame
inline std::vector<key> parse_key_script(const std::string& script) {
	std::vector<key> keys;
	keys.reserve(script.size());

	for (char c : script) {
		switch (c) {
		case 'L': keys.push_back(key::left); break;
		case 'R': keys.push_back(key::right); break;
		case 'U': keys.push_back(key::up); break;
		case 'D': keys.push_back(key::down); break;
		case 'X': keys.push_back(key::zoom_in); break;
		case 'Z': keys.push_back(key::zoom_out); break;
		default:
			throw std::invalid_argument(std::string("unknown key '") + c + "' in key script (expected L R U D X Z)");
		}
	}
	return keys;
}

inline void apply_key(camera& cam, key k, double rotation_speed) {
	switch (k) {
	case key::left:
		cam.orbit(rotation_speed, 0.0);
		break;
	case key::right:
		cam.orbit(-rotation_speed, 0.0);
		break;
	case key::up:
		cam.orbit(0.0, -rotation_speed);
		break;
	case key::down:
		cam.orbit(0.0, rotation_speed);
		break;
	case key::zoom_in:
		cam.zoom(1.0);
		break;
	case key::zoom_out:
		cam.zoom(-1.0);
		break;
	}
}

#pragma once

#include "material.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

//materials library
class MaterialLibrary {
public:
	MaterialLibrary() = default;

	//add material to library, replacing one with the same name
	void add(const std::string& name, const material& m) {
		library[name] = m;
	}

	bool contains(const std::string& name) const {
		return library.find(name) != library.end();
	}

	//get material from library by name
	const material& get(const std::string& name) const {
		auto it = library.find(name);
		if (it == library.end()) {
			throw std::out_of_range("material '" + name + "' not found in library");
		}
		return it->second;
	}

	//get all material names in the library
	std::vector<std::string> names() const {
		std::vector<std::string> result;
		for (const auto& [name, mat] : library) {
			result.push_back(name);
		}
		return result;
	}

private:
	std::map<std::string, material> library;
};

#pragma once

#include "hittable.hpp"

#include <utility>
#include <vector>

//flat, ordered list of objects tested one by one (no acceleration structure)
class hittable_list : public hittable {
public:
	std::vector<shared_ptr<hittable>> objects;

	//default constructor
	hittable_list() {}
	//add new object to the list
	void add(shared_ptr<hittable> object) {
		objects.push_back(std::move(object));
	}
	//append every object of another list, keeping its order
	void add(const hittable_list& other) {
		objects.insert(objects.end(), other.objects.begin(), other.objects.end());
	}

	size_t size() const { return objects.size(); }
	bool empty() const { return objects.empty(); }

	//nearest hit along the ray, the earlier object wins an exact tie
	std::optional<hit_record> hit(const ray& r) const override {
		std::optional<hit_record> closest;
		double closest_so_far = infinity;

		for (const auto& object : objects) {
			auto rec = object->hit(r);
			if (rec && rec->t < closest_so_far) {
				closest_so_far = rec->t;
				closest = std::move(rec);
			}
		}
		return closest;
	}

	//hit of the first object in list order that the ray touches at all
	std::optional<hit_record> first_hit(const ray& r) const {
		for (const auto& object : objects) {
			if (auto rec = object->hit(r)) {
				return rec;
			}
		}
		return std::nullopt;
	}
};

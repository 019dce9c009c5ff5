#pragma once

#include "hittable.hpp"
#include "texture.hpp"

#include <utility>

//axis aligned box with top / side / bottom textures
class cube : public hittable {
public:
	//min and max corners in world space, min <= max on every axis
	cube(const point3& min_corner, const point3& max_corner, const material& mat,
		shared_ptr<const texture> top, shared_ptr<const texture> side, shared_ptr<const texture> bottom)
		: min_p(min_corner)
		, max_p(max_corner)
		, mat(mat)
		, top_texture(std::move(top))
		, side_texture(std::move(side))
		, bottom_texture(std::move(bottom))
	{}

	//same texture on every face
	cube(const point3& min_corner, const point3& max_corner, const material& mat,
		shared_ptr<const texture> tex)
		: cube(min_corner, max_corner, mat, tex, tex, tex)
	{}

	const point3& min() const { return min_p; }
	const point3& max() const { return max_p; }
	const material& base_material() const { return mat; }

	//slab method
	std::optional<hit_record> hit(const ray& r) const override {
		interval ray_t = interval::universe;

		//clip [t_enter, t_exit] against the x, y and z slabs in turn
		for (int axis = 0; axis < 3; ++axis) {
			//zero direction components give +-infinity, which min/max handle
			double t0 = (min_p[axis] - r.origin()[axis]) / r.direction()[axis];
			double t1 = (max_p[axis] - r.origin()[axis]) / r.direction()[axis];

			if (t0 > t1) {
				std::swap(t0, t1);
			}
			ray_t.clip(t0, t1);

			//no intersection
			if (ray_t.is_empty()) {
				return std::nullopt;
			}
		}

		//box is behind the ray origin (or the origin is inside it)
		if (ray_t.min < 0.0) {
			return std::nullopt;
		}

		hit_record rec;
		rec.t = ray_t.min;
		rec.p = r.at(rec.t);
		rec.normal = compute_normal(rec.p);

		const texture* tex = face_texture(rec);
		color texel = tex ? tex->value(rec.u, rec.v) : mat.diffuse;
		rec.mat = mat.with_diffuse(texel);

		return rec;
	}

private:
	point3 min_p;
	point3 max_p;
	material mat;
	shared_ptr<const texture> top_texture;
	shared_ptr<const texture> side_texture;
	shared_ptr<const texture> bottom_texture;

	//classify the face under rec.p, fill u, v and the face, return its texture
	const texture* face_texture(hit_record& rec) const {
		const point3& p = rec.p;
		vec3 extent = max_p - min_p;

		if (nearly_equal(p.y(), max_p.y())) {
			rec.face = cube_face::top;
			rec.u = (p.x() - min_p.x()) / extent.x();
			rec.v = (p.z() - min_p.z()) / extent.z();
			return top_texture.get();
		}
		if (nearly_equal(p.y(), min_p.y())) {
			rec.face = cube_face::bottom;
			rec.u = (p.x() - min_p.x()) / extent.x();
			rec.v = (p.z() - min_p.z()) / extent.z();
			return bottom_texture.get();
		}
		if (nearly_equal(p.x(), min_p.x()) || nearly_equal(p.x(), max_p.x())) {
			rec.face = cube_face::side;
			rec.u = (p.z() - min_p.z()) / extent.z();
			rec.v = (p.y() - min_p.y()) / extent.y();
			return side_texture.get();
		}

		//front and back faces reuse the side texture
		rec.face = cube_face::front_back;
		rec.u = (p.x() - min_p.x()) / extent.x();
		rec.v = (p.y() - min_p.y()) / extent.y();
		return side_texture.get();
	}

	//function to determine normal vector in intersection, first match wins
	vec3 compute_normal(const point3& p) const {
		if (nearly_equal(p.x(), min_p.x())) return vec3(-1, 0, 0);
		if (nearly_equal(p.x(), max_p.x())) return vec3(1, 0, 0);

		if (nearly_equal(p.y(), min_p.y())) return vec3(0, -1, 0);
		if (nearly_equal(p.y(), max_p.y())) return vec3(0, 1, 0);

		if (nearly_equal(p.z(), min_p.z())) return vec3(0, 0, -1);
		return vec3(0, 0, 1);
	}
};

#pragma once

//basic types and material library
#include "rtweekend.hpp"
#include "material_library.hpp"
//geometry
#include "hittable_list.hpp"
#include "cube.hpp"
#include "texture.hpp"
#include "renderer.hpp"

//headers
#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <string>

//split the region [min, max] into voxel_size cubes, the last row on each axis is clipped to max
inline hittable_list create_voxelized_cube(const point3& min, const point3& max,
	shared_ptr<const texture> top_texture, shared_ptr<const texture> side_texture,
	shared_ptr<const texture> bottom_texture, const material& mat, double voxel_size) {
	hittable_list cubes;

	int x_steps = static_cast<int>(std::ceil((max.x() - min.x()) / voxel_size));
	int y_steps = static_cast<int>(std::ceil((max.y() - min.y()) / voxel_size));
	int z_steps = static_cast<int>(std::ceil((max.z() - min.z()) / voxel_size));

	for (int i = 0; i < x_steps; i++) {
		for (int j = 0; j < y_steps; j++) {
			for (int k = 0; k < z_steps; k++) {
				point3 cube_min(
					min.x() + i * voxel_size,
					min.y() + j * voxel_size,
					min.z() + k * voxel_size
				);
				point3 cube_max(
					std::min(cube_min.x() + voxel_size, max.x()),
					std::min(cube_min.y() + voxel_size, max.y()),
					std::min(cube_min.z() + voxel_size, max.z())
				);

				cubes.add(make_shared<cube>(cube_min, cube_max, mat, top_texture, side_texture, bottom_texture));
			}
		}
	}

	return cubes;
}

//six thin slabs just outside a cube of edge size centered at the origin
inline hittable_list create_skybox(shared_ptr<const texture> sky_front, shared_ptr<const texture> sky_back,
	shared_ptr<const texture> sky_left, shared_ptr<const texture> sky_right,
	shared_ptr<const texture> sky_top, shared_ptr<const texture> sky_bottom, double size) {
	const double half_size = size / 2.0;
	const double thickness = 0.01;
	//plain white, no specular, no fresnel
	const material skybox_material(1.0, 0.0, 0.0, 0.0, 0.0, color(255, 255, 255), color(255, 255, 255));

	hittable_list skybox;
	skybox.add(make_shared<cube>(point3(-half_size, -half_size, half_size),
		point3(half_size, half_size, half_size + thickness), skybox_material, sky_front));
	skybox.add(make_shared<cube>(point3(-half_size, -half_size, -half_size - thickness),
		point3(half_size, half_size, -half_size), skybox_material, sky_back));
	skybox.add(make_shared<cube>(point3(-half_size - thickness, -half_size, -half_size),
		point3(-half_size, half_size, half_size), skybox_material, sky_left));
	skybox.add(make_shared<cube>(point3(half_size, -half_size, -half_size),
		point3(half_size + thickness, half_size, half_size), skybox_material, sky_right));
	skybox.add(make_shared<cube>(point3(-half_size, half_size, -half_size),
		point3(half_size, half_size + thickness, half_size), skybox_material, sky_top));
	skybox.add(make_shared<cube>(point3(-half_size, -half_size - thickness, -half_size),
		point3(half_size, -half_size, half_size), skybox_material, sky_bottom));

	return skybox;
}

//loading materials
inline void load_materials(MaterialLibrary& mat_lib) {
	mat_lib.add("grass", material(0.9, 0.3, 0.05, 0.0, 0.1, color(34, 139, 34), color(255, 255, 255)));
	mat_lib.add("wood", material(0.6, 0.2, 0.1, 0.0, 0.2, color(160, 82, 45), color(200, 200, 200)));
	mat_lib.add("leaves", material(0.5, 0.1, 0.1, 0.0, 0.1, color(255, 182, 193), color(255, 200, 220)));
	mat_lib.add("water", material(0.4, 0.3, 0.8, 0.7, 0.5, color(0, 0, 255), color(63, 96, 188)));
	mat_lib.add("glowstone", material(1.0, 0.9, 0.3, 0.0, 0.5, color(255, 215, 0), color(255, 255, 200)));
}

//textures of the biome, shared by every block using them
struct biome_textures {
	shared_ptr<const texture> sky;
	shared_ptr<const texture> sky_horizon;
	shared_ptr<const texture> grass_top;
	shared_ptr<const texture> grass_side;
	shared_ptr<const texture> dirt;
	shared_ptr<const texture> wood;
	shared_ptr<const texture> woodplank;
	shared_ptr<const texture> leaves;
	shared_ptr<const texture> water;
	shared_ptr<const texture> glowstone;
};

//load dir + filename, a file that does not decode becomes a flat fallback color
inline shared_ptr<const texture> load_texture(const std::string& dir, const std::string& filename, const color& fallback) {
	auto image = make_shared<image_texture>(dir + filename);
	if (image->loaded()) {
		return image;
	}
	std::cerr << "[Warning] Using flat color " << fallback << " for texture '" << filename << "'.\n";
	return make_shared<solid_color>(fallback);
}

inline biome_textures load_textures(const std::string& dir) {
	biome_textures t;
	t.sky = load_texture(dir, "sky.jpg", color(135, 206, 235));
	t.sky_horizon = load_texture(dir, "sky2.png", color(176, 224, 230));
	t.grass_top = load_texture(dir, "grass_top.png", color(34, 139, 34));
	t.grass_side = load_texture(dir, "grass_side.png", color(110, 130, 60));
	t.dirt = load_texture(dir, "dirt.png", color(134, 96, 67));
	t.wood = load_texture(dir, "cherrylog.png", color(160, 82, 45));
	t.woodplank = load_texture(dir, "woodplank.png", color(196, 150, 100));
	t.leaves = load_texture(dir, "cherryblossom.jpg", color(255, 182, 193));
	t.water = load_texture(dir, "water.png", color(0, 0, 255));
	t.glowstone = load_texture(dir, "glowstone.png", color(255, 215, 0));
	return t;
}

//build scene geometry: the cherry blossom biome
inline scene build_biome(const biome_textures& t, const MaterialLibrary& mat_lib, double voxel_size, double skybox_size) {
	scene world;

	const material& grass = mat_lib.get("grass");
	const material& wood = mat_lib.get("wood");
	const material& leaves = mat_lib.get("leaves");
	const material& water = mat_lib.get("water");
	const material& glowstone = mat_lib.get("glowstone");

	world.skybox = create_skybox(t.sky_horizon, t.sky, t.sky, t.sky, t.sky_horizon, t.sky, skybox_size);

	//helper for blocks with the same texture on every face
	auto block = [&](const point3& min, const point3& max, const shared_ptr<const texture>& tex, const material& mat) {
		return create_voxelized_cube(min, max, tex, tex, tex, mat, voxel_size);
	};

	// - 1. GROUND -
	world.objects.add(create_voxelized_cube(point3(-10.0, -5.5, -10.0), point3(-2.0, 0.0, 10.0),
		t.grass_top, t.grass_side, t.dirt, grass, voxel_size));
	world.objects.add(create_voxelized_cube(point3(-2.0, -5.5, -10.0), point3(2.0, -2.75, 10.0),
		t.grass_top, t.grass_side, t.dirt, grass, voxel_size));
	world.objects.add(create_voxelized_cube(point3(2.0, -5.5, -10.0), point3(10.0, 0.0, 10.0),
		t.grass_top, t.grass_side, t.dirt, grass, voxel_size));

	// - 2. RIVER AND HILL -
	world.objects.add(block(point3(-2.0, -3.0, -10.0), point3(2.0, -0.5, 10.0), t.water, water));
	world.objects.add(create_voxelized_cube(point3(-10.0, 0.0, -10.0), point3(-3.0, 3.0, -2.0),
		t.grass_top, t.grass_side, t.dirt, grass, voxel_size));

	// - 3. FIRST TREE -
	world.objects.add(block(point3(-7.5, -1.0, -7.5), point3(-5.5, 7.0, -5.5), t.wood, wood));
	world.objects.add(block(point3(-9.5, 7.0, -9.5), point3(-3.5, 9.75, -3.5), t.leaves, leaves));
	world.objects.add(block(point3(-8.5, 9.75, -8.5), point3(-4.5, 12.5, -4.5), t.leaves, leaves));

	// - 4. SECOND TREE -
	world.objects.add(block(point3(6.5, -1.0, 6.5), point3(8.5, 5.0, 8.5), t.wood, wood));
	world.objects.add(block(point3(4.5, 5.0, 4.5), point3(10.5, 7.75, 10.5), t.leaves, leaves));
	world.objects.add(block(point3(5.5, 7.75, 5.5), point3(9.5, 10.5, 9.5), t.leaves, leaves));

	// - 5. BRIDGE, POST AND GLOWSTONE -
	world.objects.add(block(point3(-5.0, 0.0, 1.0), point3(5.0, 1.0, 3.0), t.woodplank, wood));
	world.objects.add(block(point3(6.5, 0.0, -8.0), point3(7.0, 5.0, -7.0), t.wood, wood));
	world.objects.add(block(point3(5.5, 5.0, -8.5), point3(8.5, 7.75, -5.75), t.glowstone, glowstone));

	return world;
}

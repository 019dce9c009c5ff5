#include "environment.hpp"
#include "framebuffer.hpp"
#include "material_library.hpp"
#include "scene_management.hpp"
#include "stb_image.h"

#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace {

material grass() {
	return material(0.9, 0.3, 0.05, 0.0, 0.1, color(34, 139, 34), color(255, 255, 255));
}

}

TEST(Voxelize, SplitsRegionAndClipsLastVoxel) {
	shared_ptr<const texture> tex = make_shared<solid_color>(1, 2, 3);
	hittable_list cubes = create_voxelized_cube(point3(0, 0, 0), point3(10, 5, 3.75), tex, tex, tex, grass(), 3.75);

	ASSERT_EQ(cubes.size(), 6u);
	for (const auto& object : cubes.objects) {
		auto c = std::dynamic_pointer_cast<cube>(object);
		ASSERT_NE(c, nullptr);
		EXPECT_LE(c->min().x(), c->max().x());
		EXPECT_LE(c->min().y(), c->max().y());
		EXPECT_LE(c->min().z(), c->max().z());
		EXPECT_LE(c->max().x(), 10.0);
		EXPECT_LE(c->max().y(), 5.0);
	}

	auto last = std::dynamic_pointer_cast<cube>(cubes.objects.back());
	EXPECT_DOUBLE_EQ(last->min().x(), 7.5);
	EXPECT_DOUBLE_EQ(last->max().x(), 10.0);
	EXPECT_DOUBLE_EQ(last->min().y(), 3.75);
	EXPECT_DOUBLE_EQ(last->max().y(), 5.0);
}

TEST(Voxelize, SharesTexturesInsteadOfCopying) {
	shared_ptr<const texture> top = make_shared<solid_color>(1, 1, 1);
	shared_ptr<const texture> side = make_shared<solid_color>(2, 2, 2);
	hittable_list cubes = create_voxelized_cube(point3(0, 0, 0), point3(7.5, 3.75, 3.75), top, side, side, grass(), 3.75);

	ASSERT_EQ(cubes.size(), 2u);
	EXPECT_EQ(top.use_count(), 3);
	EXPECT_EQ(side.use_count(), 5);
}

TEST(Skybox, SlabsEncloseTheOrigin) {
	shared_ptr<const texture> sky = make_shared<solid_color>(135, 206, 235);
	hittable_list skybox = create_skybox(sky, sky, sky, sky, sky, sky, 100.0);
	ASSERT_EQ(skybox.size(), 6u);

	for (const auto& object : skybox.objects) {
		auto c = std::dynamic_pointer_cast<cube>(object);
		ASSERT_NE(c, nullptr);
		EXPECT_LE(c->min().x(), c->max().x());
		EXPECT_LE(c->min().y(), c->max().y());
		EXPECT_LE(c->min().z(), c->max().z());
	}

	const vec3 directions[] = {
		vec3(1, 0, 0), vec3(-1, 0, 0), vec3(0, 1, 0), vec3(0, -1, 0), vec3(0, 0, 1), vec3(0, 0, -1),
	};
	for (const vec3& d : directions) {
		auto rec = skybox.first_hit(ray(point3(0, 0, 0), d));
		ASSERT_TRUE(rec.has_value());
		EXPECT_NEAR(rec->t, 50.0, 1e-9);
		EXPECT_EQ(rec->mat.diffuse, color(135, 206, 235));
	}
}

TEST(MaterialLibrary, HoldsBiomeMaterials) {
	MaterialLibrary lib;
	load_materials(lib);

	for (const char* name : { "grass", "wood", "leaves", "water", "glowstone" }) {
		EXPECT_TRUE(lib.contains(name)) << name;
	}
	EXPECT_EQ(lib.names().size(), 5u);
	EXPECT_DOUBLE_EQ(lib.get("water").reflectivity, 0.5);
	EXPECT_DOUBLE_EQ(lib.get("water").transparency, 0.7);
	EXPECT_EQ(lib.get("glowstone").diffuse, color(255, 215, 0));
	EXPECT_THROW(lib.get("lava"), std::out_of_range);
}

TEST(Biome, BuildsWithFallbackTextures) {
	MaterialLibrary lib;
	load_materials(lib);
	biome_textures textures = load_textures("no/such/dir/");

	ASSERT_NE(textures.grass_top, nullptr);
	EXPECT_EQ(textures.grass_top->value(0.5, 0.5), color(34, 139, 34));

	scene world = build_biome(textures, lib, 3.75, 100.0);
	EXPECT_EQ(world.objects.size(), 129u);
	EXPECT_EQ(world.skybox.size(), 6u);

	//looking straight down at the grass left of the river
	auto rec = world.objects.hit(ray(point3(-8, 50, 4), vec3(0, -1, 0)));
	ASSERT_TRUE(rec.has_value());
	EXPECT_NEAR(rec->p.y(), 0.0, 1e-9);
	EXPECT_EQ(rec->face, cube_face::top);
	EXPECT_EQ(rec->mat.diffuse, color(34, 139, 34));
}

TEST(DayCycle, SunDuringDay) {
	DayCycle cycle;
	cycle.advance();

	EXPECT_FALSE(cycle.is_night());
	auto lights = cycle.lights();
	ASSERT_EQ(lights.size(), 1u);
	EXPECT_NEAR(lights[0].position.x(), 15.0 * std::cos(0.1), 1e-12);
	EXPECT_NEAR(lights[0].position.y(), 25.0 * std::sin(0.1), 1e-12);
	EXPECT_NEAR(lights[0].position.z(), 15.0, 1e-12);
	EXPECT_EQ(lights[0].col, color(255, 255, 224));
	EXPECT_DOUBLE_EQ(lights[0].intensity, 1.0);
}

TEST(DayCycle, MoonAndGlowstoneAtNight) {
	DayCycle cycle;
	cycle.time = 4.0;

	EXPECT_TRUE(cycle.is_night());
	auto lights = cycle.lights();
	ASSERT_EQ(lights.size(), 2u);

	double moon_angle = std::fmod(4.0 + pi, 2.0 * pi);
	EXPECT_NEAR(lights[0].position.x(), 15.0 * std::cos(moon_angle), 1e-12);
	EXPECT_NEAR(lights[0].position.y(), 25.0 * std::sin(moon_angle), 1e-12);
	EXPECT_GT(lights[0].position.y(), 0.0);
	EXPECT_DOUBLE_EQ(lights[0].intensity, 0.5);

	EXPECT_NEAR(lights[1].position.y(), 6.375, 1e-12);
	EXPECT_DOUBLE_EQ(lights[1].intensity, 0.01);
}

TEST(DayCycle, WrapsAfterFullTurn) {
	DayCycle cycle;
	cycle.time = 2.0 * pi + 0.5;
	EXPECT_NEAR(cycle.sun_angle(), 0.5, 1e-12);
	EXPECT_FALSE(cycle.is_night());
}

TEST(Framebuffer, IgnoresOutOfRangeWrites) {
	framebuffer fb(4, 3);
	fb.clear(0x112233);

	fb.draw_pixel(-1, 0, 0xFFFFFF);
	fb.draw_pixel(4, 0, 0xFFFFFF);
	fb.draw_pixel(0, 3, 0xFFFFFF);
	for (std::uint32_t p : fb.pixels()) {
		EXPECT_EQ(p, 0x112233u);
	}

	fb.draw_pixel(3, 2, 0xABCDEF);
	EXPECT_EQ(fb.pixel(3, 2), 0xABCDEFu);

	fb.set_current_color(0x010203);
	fb.point(0, 0);
	EXPECT_EQ(fb.pixel(0, 0), 0x010203u);
}

TEST(Framebuffer, ClearUsesBackgroundColor) {
	framebuffer fb(2, 2);
	fb.set_background_color(0x0000FF);
	fb.clear();
	EXPECT_EQ(fb.pixel(1, 1), 0x0000FFu);
	EXPECT_EQ(fb.pixel(9, 9), 0x0000FFu);
}

TEST(Framebuffer, RejectsEmptySize) {
	EXPECT_THROW(framebuffer(0, 10), std::invalid_argument);
	EXPECT_THROW(framebuffer(10, -1), std::invalid_argument);
}

TEST(Framebuffer, SavePngWritesDecodableFile) {
	framebuffer fb(5, 3);
	fb.clear(0x3F60BC);
	fb.draw_pixel(4, 2, 0xFF0000);

	std::filesystem::path path = std::filesystem::temp_directory_path() / "biome_framebuffer_test.png";
	std::filesystem::remove(path);

	ASSERT_TRUE(fb.save_png(path.string()));
	ASSERT_TRUE(std::filesystem::exists(path));

	int w = 0, h = 0, channels = 0;
	unsigned char* data = stbi_load(path.string().c_str(), &w, &h, &channels, 3);
	ASSERT_NE(data, nullptr);
	EXPECT_EQ(w, 5);
	EXPECT_EQ(h, 3);
	EXPECT_EQ(data[0], 0x3F);
	EXPECT_EQ(data[1], 0x60);
	EXPECT_EQ(data[2], 0xBC);

	size_t last = (static_cast<size_t>(2) * 5 + 4) * 3;
	EXPECT_EQ(data[last + 0], 0xFF);
	EXPECT_EQ(data[last + 1], 0x00);
	EXPECT_EQ(data[last + 2], 0x00);
	stbi_image_free(data);

	std::filesystem::remove(path);
}

TEST(Framebuffer, SavePngReportsUnwritablePath) {
	framebuffer fb(2, 2);
	std::filesystem::path dir = std::filesystem::temp_directory_path() / "biome_no_such_directory";
	std::filesystem::remove_all(dir);

	EXPECT_FALSE(fb.save_png((dir / "frame.png").string()));
	EXPECT_FALSE(std::filesystem::exists(dir));
}

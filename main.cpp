#include "rtweekend.hpp"
#include "camera.hpp"
#include "controls.hpp"
#include "environment.hpp"
#include "framebuffer.hpp"
#include "renderer.hpp"
#include "scene_management.hpp"
#include "settings.hpp"

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

//usage: biome_viewer [frames] [key_script] [output_prefix]
static bool parse_arguments(int argc, char** argv, render_settings& settings) {
	if (argc > 1) {
		try {
			size_t used = 0;
			settings.frames = std::stoi(argv[1], &used);
			if (used != std::string(argv[1]).size() || settings.frames < 1) {
				throw std::invalid_argument(argv[1]);
			}
		}
		catch (const std::exception&) {
			std::cerr << "[Error] Frame count must be a positive integer, got '" << argv[1] << "'.\n";
			return false;
		}
	}
	if (argc > 2) {
		settings.key_script = argv[2];
	}
	if (argc > 3) {
		settings.output_prefix = argv[3];
	}
	return true;
}

static std::string frame_filename(const std::string& prefix, int frame) {
	char number[16];
	std::snprintf(number, sizeof(number), "%03d", frame);
	return prefix + number + ".png";
}

int main(int argc, char** argv) {
	render_settings settings;
	if (!parse_arguments(argc, argv, settings)) {
		return EXIT_FAILURE;
	}

	try {
		std::vector<key> keys = parse_key_script(settings.key_script);

		//materials and textures
		MaterialLibrary mat_lib;
		load_materials(mat_lib);
		biome_textures textures = load_textures(settings.texture_dir);

		//set up the biome
		scene world = build_biome(textures, mat_lib, settings.voxel_size, settings.skybox_size);
		std::cerr << "[Info] Scene objects: " << world.objects.size()
			<< ", skybox slabs: " << world.skybox.size() << "\n";

		//create camera
		camera cam(settings.lookfrom, settings.lookat, settings.vup);
		framebuffer fb(settings.image_width, settings.image_height);
		DayCycle cycle;

		render_options options;
		options.fov = settings.fov;
		options.num_threads = settings.num_threads;
		options.show_progress = settings.show_progress;

		for (int frame = 0; frame < settings.frames; frame++) {
			//animation and input only change between frames
			cycle.advance();
			std::vector<light> lights = cycle.lights();

			if (!keys.empty()) {
				apply_key(cam, keys[frame % keys.size()], settings.rotation_speed);
			}

			render(fb, world, cam, lights, cycle.is_night(), options);

			std::string filename = frame_filename(settings.output_prefix, frame);
			if (!fb.save_png(filename)) {
				return EXIT_FAILURE;
			}
			std::cerr << "[Info] Frame " << frame << (cycle.is_night() ? " (night)" : " (day)")
				<< " saved to " << filename << "\n";
		}
	}
	catch (const std::exception& e) {
		std::cerr << "[Error] " << e.what() << "\n";
		return EXIT_FAILURE;
	}

	return 0;
}

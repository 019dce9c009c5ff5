#pragma once

#include "camera.hpp"
#include "framebuffer.hpp"
#include "hittable_list.hpp"
#include "light.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iomanip>
#include <mutex>
#include <thread>
#include <vector>

//solid objects plus the enclosing sky shell
struct scene {
	hittable_list objects;
	hittable_list skybox;
};

//per frame render options
struct render_options {
	double fov = pi / 3.0;     //field of view, radians
	int num_threads = 0;       //0 = one thread per core
	bool show_progress = false;
};

//background when neither the scene nor the skybox is hit
inline color background_color(bool is_night) {
	return is_night ? color(10, 10, 30) : color(63, 96, 188);
}

//color seen along one camera ray
inline color cast_ray(const point3& origin, const vec3& direction, const hittable_list& objects,
	const hittable_list& skybox, const std::vector<light>& lights, const camera& cam, bool is_night) {
	ray r(origin, direction);
	auto closest = objects.hit(r);

	//no object, show the sky
	if (!closest) {
		if (auto sky = skybox.first_hit(r)) {
			return sky->mat.diffuse;
		}
		return background_color(is_night);
	}

	vec3 view_dir = unit_vector(cam.eye() - closest->p);
	color lit = calculate_lighting(closest->p, closest->normal, view_dir, closest->mat, lights, objects);

	//reflectivity is both the fresnel f0 and the blend weight
	double f0 = closest->mat.reflectivity;
	double fresnel = fresnel_effect(closest->normal, view_dir, f0);
	return lit.lerp(closest->mat.fresnel_color, fresnel * closest->mat.reflectivity);
}

//draw the progress bar for done out of total lines
inline void print_progress(int done, int total) {
	double percent = total > 0 ? double(done) / total : 1.0;

	int barWidth = 40;
	int filled = int(percent * barWidth);

	std::cerr << "\r[";
	for (int i = 0; i < filled; i++) {
		std::cerr << "#"; //fill of the bar
	}
	for (int i = filled; i < barWidth; i++) {
		std::cerr << "."; //empty space of the bar
	}
	std::cerr << "] ";

	//restore the caller's float format afterwards
	std::ios::fmtflags flags = std::cerr.flags();
	std::streamsize precision = std::cerr.precision();
	std::cerr << std::fixed << std::setprecision(1)
		<< (percent * 100.0) << "% (" << done << "/" << total << " lines)"
		<< std::flush;
	std::cerr.flags(flags);
	std::cerr.precision(precision);
}

//ray trace one frame into fb, rows are split between worker threads
inline void render(framebuffer& fb, const scene& world, const camera& cam, const std::vector<light>& lights,
	bool is_night, const render_options& options = render_options()) {
	fb.clear(0x000000);

	const int image_width = fb.width();
	const int image_height = fb.height();
	const double width = image_width;
	const double height = image_height;
	const double aspect_ratio = width / height;
	const double perspective_scale = std::tan(options.fov * 0.5);

	std::atomic<int> lines_done = 0;

	auto render_rows = [&](int start_y, int end_y) {
		for (int y = start_y; y < end_y; ++y) {
			for (int x = 0; x < image_width; ++x) {
				//map the pixel to [-1, 1] and scale by aspect ratio and fov
				double screen_x = (2.0 * x) / width - 1.0;
				double screen_y = -(2.0 * y) / height + 1.0;

				screen_x = screen_x * aspect_ratio * perspective_scale;
				screen_y = screen_y * perspective_scale;

				vec3 ray_direction = unit_vector(vec3(screen_x, screen_y, -1.0));
				vec3 rotated_direction = cam.base_change(ray_direction);

				color pixel_color = cast_ray(cam.eye(), rotated_direction, world.objects, world.skybox,
					lights, cam, is_night);

				//every row belongs to exactly one worker
				fb.draw_pixel(x, y, pixel_color.to_hex());
			}

			lines_done++;
		}
	};

	//number of threads = number of cores unless configured
	int num_threads = options.num_threads > 0
		? options.num_threads
		: static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
	num_threads = std::min(num_threads, image_height);

	std::vector<std::thread> threads;
	std::exception_ptr worker_error = nullptr;
	std::mutex error_mutex;

	//split lines between threads
	int rows_per_thread = image_height / num_threads;
	int extra = image_height % num_threads;
	int start = 0;

	for (int t = 0; t < num_threads; t++) {
		int end = start + rows_per_thread + (t < extra ? 1 : 0);
		threads.emplace_back([&, start, end]() {
			try {
				render_rows(start, end);
			}
			catch (...) {
				std::lock_guard<std::mutex> lock(error_mutex);
				if (!worker_error) {
					worker_error = std::current_exception();
				}
				//let the progress loop finish
				lines_done += end - start;
			}
		});
		start = end;
	}

	//progress bar
	if (options.show_progress) {
		while (lines_done < image_height) {
			print_progress(lines_done.load(), image_height);
			std::this_thread::sleep_for(std::chrono::milliseconds(200));
		}
	}

	//join threads
	for (auto& th : threads)
		th.join();

	if (options.show_progress) {
		print_progress(image_height, image_height);
		std::cerr << "\n";
	}

	if (worker_error) {
		std::rethrow_exception(worker_error);
	}
}

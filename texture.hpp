#pragma once

#include "rtweekend.hpp"
#include "stb_image.h"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

//read-only 2d color lookup, shared between every cube face using it
class texture {
public:
	virtual ~texture() = default;
	//u, v are expected in [0, 1]
	virtual color value(double u, double v) const = 0;
};

class solid_color : public texture {
public:
	solid_color(const color& albedo)
		: albedo(albedo)
	{
	}
	solid_color(double red, double green, double blue)
		: solid_color(color(red, green, blue))
	{
	}

	color value(double, double) const override {
		return albedo;
	}

private:
	color albedo;
};

class image_texture : public texture {
public:
	//decode an image file (png, jpg, bmp, tga...) with stb_image
	image_texture(const std::string& filename) {
		int components_in_file = 0;
		unsigned char* raw = stbi_load(
			filename.c_str(), &width, &height, &components_in_file, bytes_per_pixel
		);

		if (!raw) {
			std::cerr << "[Error] Could not load texture image file '" << filename
				<< "': " << stbi_failure_reason() << "\n";
			width = height = 0;
			return;
		}

		data.assign(raw, raw + static_cast<size_t>(width) * height * bytes_per_pixel);
		stbi_image_free(raw);
	}

	//wrap an in-memory rgb grid, rows top to bottom
	image_texture(int w, int h, std::vector<unsigned char> pixels)
		: data(std::move(pixels))
		, width(w)
		, height(h)
	{
		if (w <= 0 || h <= 0 || data.size() < static_cast<size_t>(w) * h * bytes_per_pixel) {
			throw std::invalid_argument("image_texture: pixel grid smaller than width x height");
		}
	}

	bool loaded() const { return height > 0 && width > 0; }

	color value(double u, double v) const override {
		//if no texture data, return solid magenta as debugging aid
		if (!loaded()) {
			return color(255, 0, 255);
		}

		//non finite coordinates come from zero sized faces
		if (!std::isfinite(u)) u = 0.0;
		if (!std::isfinite(v)) v = 0.0;

		//clamp u,v to [0,1]
		u = interval(0, 1).clamp(u);
		v = 1.0 - interval(0, 1).clamp(v); //flip v to image coordinates

		auto i = static_cast<int>(u * width);
		auto j = static_cast<int>(v * height);

		//clamp integer mapping
		if (i >= width) {
			i = width - 1;
		}
		if (j >= height) {
			j = height - 1;
		}

		const unsigned char* pixel = data.data() + (static_cast<size_t>(j) * width + i) * bytes_per_pixel;
		return color(pixel[0], pixel[1], pixel[2]);
	}

private:
	static constexpr int bytes_per_pixel = 3;

	std::vector<unsigned char> data;
	int width = 0;
	int height = 0;
};

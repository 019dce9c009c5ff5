#pragma once

#include "rtweekend.hpp"
#include "stb_image_write.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

//write-only grid of packed 0xRRGGBB pixels
class framebuffer {
public:
	framebuffer(int width, int height)
		: w(width)
		, h(height)
	{
		if (width <= 0 || height <= 0) {
			throw std::invalid_argument("framebuffer: width and height must be positive");
		}
		buffer.assign(static_cast<size_t>(width) * height, 0u);
	}

	int width() const { return w; }
	int height() const { return h; }
	const std::vector<std::uint32_t>& pixels() const { return buffer; }

	//fill every pixel with color
	void clear(std::uint32_t color) {
		std::fill(buffer.begin(), buffer.end(), color);
	}
	void clear() {
		clear(background_color);
	}

	//out of range writes are ignored
	void draw_pixel(int x, int y, std::uint32_t color) {
		if (x >= 0 && x < w && y >= 0 && y < h) {
			buffer[static_cast<size_t>(y) * w + x] = color;
		}
	}

	//draw with the current color
	void point(int x, int y) {
		draw_pixel(x, y, current_color);
	}

	//out of range reads give the background color
	std::uint32_t pixel(int x, int y) const {
		if (x >= 0 && x < w && y >= 0 && y < h) {
			return buffer[static_cast<size_t>(y) * w + x];
		}
		return background_color;
	}

	void set_background_color(std::uint32_t color) {
		background_color = color;
	}

	void set_current_color(std::uint32_t color) {
		current_color = color;
	}

	//present the frame as a .png file
	bool save_png(const std::string& filename) const {
		std::vector<unsigned char> image(static_cast<size_t>(w) * h * 3);

		for (size_t i = 0; i < buffer.size(); i++) {
			image[i * 3 + 0] = static_cast<unsigned char>((buffer[i] >> 16) & 0xFF);
			image[i * 3 + 1] = static_cast<unsigned char>((buffer[i] >> 8) & 0xFF);
			image[i * 3 + 2] = static_cast<unsigned char>(buffer[i] & 0xFF);
		}

		if (!stbi_write_png(filename.c_str(), w, h, 3, image.data(), w * 3)) {
			std::cerr << "[Error] Could not write image file '" << filename << "'.\n";
			return false;
		}
		return true;
	}

private:
	int w;
	int h;
	std::vector<std::uint32_t> buffer;
	std::uint32_t background_color = 0x000000;
	std::uint32_t current_color = 0xFFFFFF;
};

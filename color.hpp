#pragma once

#include "interval.hpp"

#include <cstdint>
#include <ostream>

//rgb color with channels in 8-bit range [0, 255]
//channels are kept as doubles while blending and may leave the range,
//to_hex() saturates them when packing
class color {
public:
	double r, g, b;

	constexpr color() : r(0), g(0), b(0) {}
	constexpr color(double red, double green, double blue) : r(red), g(green), b(blue) {}

	//build from a packed 0xRRGGBB value
	static color from_hex(std::uint32_t hex) {
		return color(
			static_cast<double>((hex >> 16) & 0xFF),
			static_cast<double>((hex >> 8) & 0xFF),
			static_cast<double>(hex & 0xFF)
		);
	}

	//multiply every channel by factor
	color scale(double factor) const {
		return color(r * factor, g * factor, b * factor);
	}

	//linear interpolation towards other, factor 0 keeps this color and 1 gives other
	color lerp(const color& other, double factor) const {
		double t = interval(0.0, 1.0).clamp(factor);
		return color(
			r * (1.0 - t) + other.r * t,
			g * (1.0 - t) + other.g * t,
			b * (1.0 - t) + other.b * t
		);
	}

	//pack to 0xRRGGBB, saturating every channel to [0, 255]
	std::uint32_t to_hex() const {
		return (pack_channel(r) << 16) | (pack_channel(g) << 8) | pack_channel(b);
	}

	color& operator+=(const color& c) {
		r += c.r;
		g += c.g;
		b += c.b;
		return *this;
	}

private:
	static std::uint32_t pack_channel(double c) {
		//NaN fails both comparisons inside clamp, map it to black
		if (!(c == c)) {
			return 0;
		}
		return static_cast<std::uint32_t>(interval(0.0, 255.0).clamp(c));
	}
};

inline color operator+(const color& a, const color& b) {
	return color(a.r + b.r, a.g + b.g, a.b + b.b);
}

inline color operator*(const color& c, double t) {
	return c.scale(t);
}

inline color operator*(double t, const color& c) {
	return c.scale(t);
}

inline bool operator==(const color& a, const color& b) {
	return a.r == b.r && a.g == b.g && a.b == b.b;
}

//allows to display color as (r g b)
inline std::ostream& operator<<(std::ostream& out, const color& c) {
	return out << c.r << " " << c.g << " " << c.b;
}

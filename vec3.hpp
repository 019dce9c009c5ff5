#pragma once

#include <cmath>

//class representing 3-dimensional vector
class vec3 {
public:
	//variable for x, y and z
	double e[3];

	//default constructor: initializes to (0, 0, 0)
	constexpr vec3() : e{ 0, 0, 0 } {}

	//parameterized constructor: initializes to specific values (e0, e1, e2)
	constexpr vec3(double e0, double e1, double e2) : e{ e0, e1, e2 } {}

	//getter methods for individual components (x, y, z)
	constexpr double x() const {
		return e[0];
	}
	constexpr double y() const {
		return e[1];
	}
	constexpr double z() const {
		return e[2];
	}

	//unary minus operator to negate the vector
	constexpr vec3 operator-() const {
		return vec3(-e[0], -e[1], -e[2]);
	}

	//array index operators
	constexpr double operator[](int i) const {
		return e[i];
	}
	double& operator[](int i) {
		return e[i];
	}

	//addition assignment (v += u)
	vec3& operator+=(const vec3& v) {
		e[0] += v.e[0];
		e[1] += v.e[1];
		e[2] += v.e[2];
		return *this;
	}
	//multiplication assignment (v *= scalar)
	vec3& operator*=(double t) {
		e[0] *= t;
		e[1] *= t;
		e[2] *= t;
		return *this;
	}

	//length (magnitude) of the vector
	double length() const {
		return std::sqrt(length_squared());
	}

	//length squared (no square root for efficiency)
	constexpr double length_squared() const {
		return e[0] * e[0] + e[1] * e[1] + e[2] * e[2];
	}

	bool near_zero() const {
		//return true if the vector is close to zero in all dimensions.
		auto s = 1e-8;
		return (std::fabs(e[0]) < s) && (std::fabs(e[1]) < s) && (std::fabs(e[2]) < s);
	}
};

//point3 is allias for vec3, but useful for geometric clarity in the code
using point3 = vec3;

//vector utility functions
//
//vector addition (u + v)
inline vec3 operator+(const vec3& u, const vec3& v) {
	return vec3(u.e[0] + v.e[0], u.e[1] + v.e[1], u.e[2] + v.e[2]);
}

//vector subtraction (u - v)
inline vec3 operator-(const vec3& u, const vec3& v) {
	return vec3(u.e[0] - v.e[0], u.e[1] - v.e[1], u.e[2] - v.e[2]);
}

//multiply by scalar
inline vec3 operator*(double t, const vec3& v) {
	return vec3(t * v.e[0], t * v.e[1], t * v.e[2]);
}

//scalar multiplication (v * t)
inline vec3 operator*(const vec3& v, double t) {
	return t * v;
}

//scalar division (v / t)
inline vec3 operator/(const vec3& v, double t) {
	return (1 / t) * v;
}

//dot product of two vectors (u . v)
inline double dot(const vec3& u, const vec3& v) {
	return u.e[0] * v.e[0] + u.e[1] * v.e[1] + u.e[2] * v.e[2];
}
//cross product
inline vec3 cross(const vec3& u, const vec3& v) {
	return vec3(u.e[1] * v.e[2] - u.e[2] * v.e[1],
		u.e[2] * v.e[0] - u.e[0] * v.e[2],
		u.e[0] * v.e[1] - u.e[1] * v.e[0]);
}

//return unit vector with length = 1 with the same direction to v
inline vec3 unit_vector(const vec3& v) {
	double len = v.length();
	if (len < 1e-8) return vec3(0, 0, 0); //zero stays zero instead of NaN
	return v / len;
}

//reflect v about the normal n
inline vec3 reflect(const vec3& v, const vec3& n) {
	return v - 2 * dot(v, n) * n;
}

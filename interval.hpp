#pragma once

#include <limits>
#include <algorithm>

//closed parametric range [min, max]
class interval {
public:
	double min, max;

	//default interval is empty
	interval()
		: min(+std::numeric_limits<double>::infinity())
		, max(-std::numeric_limits<double>::infinity())
	{
	}

	//parametrical constructor with interval min and max
	interval(double min, double max) : min(min), max(max) {}

	bool is_empty() const { return min > max; }
	double clamp(double x) const {
		if (x < min) { return min; }
		if (x > max) { return max; }
		return x;
	}

	//narrow this interval to its overlap with [lo, hi]
	//NaN bounds leave the interval unchanged
	void clip(double lo, double hi) {
		min = std::max(min, lo);
		max = std::min(max, hi);
	}

	static const interval universe;
};

//every t value
inline const interval interval::universe = interval(-std::numeric_limits<double>::infinity(), +std::numeric_limits<double>::infinity());

#ifndef EMBER_MATH_HPP_INCLUDED
#define EMBER_MATH_HPP_INCLUDED

#pragma once

// Classes in this file:
//     range
//
// Functions in this file:
//     almost_equal, approx_equal
//     clamp, clamp_hi, clamp_lo
//     lerp, inverse_lerp, quadratic_interp, bilinear_interp
//     nearest_multiple
//     gcd, lcm

#include <ember/error.hpp>

#include <boost/assert.hpp>

#include <type_traits>
#include <iterator>
#include <ostream>
#include <sstream>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <cmath>

namespace ember {

constexpr float pi = 3.14159265358979323846f;
constexpr float two_pi = 2.0f * pi;

constexpr float approx_equal_tolerance = 0.0001f;

inline bool approx_equal(float a, float b) noexcept {
	return std::abs(a - b) < approx_equal_tolerance;
}

// http://www.cygnus-software.com/papers/comparingfloats/comparingfloats.htm
inline bool almost_equal(float a, float b, int max_ulps = 16) noexcept {
	// Small enough that the default NAN won't compare as equal to anything
	BOOST_ASSERT(max_ulps > 0 && max_ulps < 4 * 1024 * 1024);
	int32_t a_int;
	int32_t b_int;
	std::memcpy(&a_int, &a, sizeof(a));
	std::memcpy(&b_int, &b, sizeof(b));
	// Make both lexicographically ordered as twos-complement ints
	if (a_int < 0)
		a_int = static_cast<int32_t>(0x80000000u - static_cast<uint32_t>(a_int));
	if (b_int < 0)
		b_int = static_cast<int32_t>(0x80000000u - static_cast<uint32_t>(b_int));
	return std::llabs(static_cast<int64_t>(a_int) - b_int) <= max_ulps;
}

template <typename T>
constexpr T clamp(T val, T lo, T hi) noexcept {
	return val < lo ? lo : (val > hi ? hi : val);
}

template <typename T>
constexpr T clamp_hi(T val, T hi) noexcept {
	return val > hi ? hi : val;
}

template <typename T>
constexpr T clamp_lo(T val, T lo) noexcept {
	return val < lo ? lo : val;
}

/// Linear interpolation for scalars and vectors, both endpoints share one type
template <typename T>
inline T lerp(const T& a, const T& b, float u) {
	return a + (b - a) * u;
}

/// Where `val` sits between `lo` and `hi`, outside [0, 1] when `val` is outside the interval
inline float inverse_lerp(float val, float lo, float hi) {
	const float delta = hi - lo;
	if (delta == 0.0f) {
		std::ostringstream ss;
		ss << "inverse_lerp(" << val << ", " << lo << ", " << hi << ") on an empty interval";
		throw_error(errc::division_by_zero, ss.str());
	}
	return (val - lo) / delta;
}

/// Quadratic curve through `x0`, `x1`, `x2` placed at u = 0, 1/2, 1
template <typename T>
inline T quadratic_interp(const T& x0, const T& x1, const T& x2, float u) {
	return (x0 * 2.0f - x1 * 4.0f + x2 * 2.0f) * (u * u) + (x0 * -3.0f + x1 * 4.0f - x2) * u + x0;
}

/// Bilinear interpolation, clockwise from top left: a, b, c, d
template <typename T>
inline T bilinear_interp(const T& a, const T& b, const T& c, const T& d, float u, float v) {
	return lerp(lerp(a, b, u), lerp(d, c, u), v);
}

/// Rounds to the nearest multiple of `target`, halfway values round up (6, 4 -> 8)
template <typename T>
inline T nearest_multiple(T num, T target) {
	static_assert(std::is_arithmetic<T>::value, "nearest_multiple needs an arithmetic type");
	if (target == 0) {
		std::ostringstream ss;
		ss << "nearest_multiple(" << num << ", 0)";
		throw_error(errc::division_by_zero, ss.str());
	}
	const double half = std::floor(static_cast<double>(target) / 2.0);
	return static_cast<T>(std::floor((num + half) / target) * target);
}

inline long gcd(long a, long b) noexcept {
	while (b) {
		long t = a % b;
		a = b;
		b = t;
	}
	return a;
}

/// Lowest common multiple of all values in [first, last)
template <typename InputIterator>
inline long lcm(InputIterator first, InputIterator last) {
	if (first == last)
		throw_error(errc::empty_choice, "lcm of an empty sequence");

	long result = *first;
	for (++first; first != last; ++first) {
		const long value = *first;
		const long divisor = gcd(result, value);
		if (divisor == 0)
			throw_error(errc::division_by_zero, "lcm of zeros");
		result = result / divisor * value;
	}
	return result;
}

///
/// Real interval that starts out empty and grows with include()
///
class range {
public:
	range() noexcept = default;

	range(float lo, float hi) noexcept {
		include(lo);
		include(hi);
	}

	bool initialized() const noexcept { return _initialized; }

	float lo() const { check("lo"); return _lo; }
	float hi() const { check("hi"); return _hi; }

	float span() const { check("span"); return _hi - _lo; }
	float mid() const { check("mid"); return (_lo + _hi) / 2.0f; }

	/// Expand to contain `val`, the first value initializes the range
	range& include(float val) noexcept {
		if (!_initialized) {
			_lo = _hi = val;
			_initialized = true;
		} else {
			if (val < _lo)
				_lo = val;
			if (val > _hi)
				_hi = val;
		}
		return *this;
	}

	/// Expand to contain both extents of `other`
	range& include_range(const range& other) {
		check("include_range");
		other.check("include_range argument");
		include(other._lo);
		include(other._hi);
		return *this;
	}

	bool contains(float val) const { check("contains"); return val >= _lo && val <= _hi; }

	float clamp(float val) const { check("clamp"); return ember::clamp(val, _lo, _hi); }
	float clamp_hi(float val) const { check("clamp_hi"); return ember::clamp_hi(val, _hi); }
	float clamp_lo(float val) const { check("clamp_lo"); return ember::clamp_lo(val, _lo); }

	friend std::ostream& operator<<(std::ostream& os, const range& r) {
		if (r._initialized)
			os << '(' << r._lo << " -> " << r._hi << ')';
		else
			os << "(<empty range>)";
		return os;
	}

private:
	void check(const char* operation) const {
		if (!_initialized)
			throw_error(errc::uninitialized_range, std::string("range::") + operation + " on an uninitialized range");
	}

private:
	float _lo = 0.0f;
	float _hi = 0.0f;
	bool _initialized = false;
};

} // namespace ember

#endif // EMBER_MATH_HPP_INCLUDED

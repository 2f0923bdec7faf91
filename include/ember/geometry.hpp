#ifndef EMBER_GEOMETRY_HPP_INCLUDED
#define EMBER_GEOMETRY_HPP_INCLUDED

#pragma once

// Classes in this file:
//     basic_point<>
//     basic_rect<>
//     vector2
//     polar2
//
// Functions in this file:
//     clamp_point_to_rect
//     split_rect_horizontally, split_rect_vertically

#include <ember/error.hpp>

#include <type_traits>
#include <vector>
#include <ostream>
#include <sstream>
#include <cmath>
#include <algorithm>

namespace ember {

template <typename T, typename = typename std::enable_if_t<std::is_arithmetic<T>::value>>
struct basic_point {
	T x{};
	T y{};

	constexpr basic_point() noexcept = default;
	constexpr basic_point(T x, T y) noexcept
		: x(x), y(y) {}

	template <typename U>
	constexpr basic_point(const basic_point<U>& p) noexcept
		: x(static_cast<T>(p.x))
		, y(static_cast<T>(p.y))
	{}

	friend bool operator==(const basic_point& lhs, const basic_point& rhs) noexcept {
		return lhs.x == rhs.x && lhs.y == rhs.y;
	}

	friend bool operator!=(const basic_point& lhs, const basic_point& rhs) noexcept {
		return !(lhs == rhs);
	}

	template <typename CharT>
	friend std::basic_ostream<CharT>& operator<<(std::basic_ostream<CharT>& os, const basic_point& p) {
		os << '{' << p.x << ';' << p.y << '}';
		return os;
	}
};

/// Integer pixel coordinates handed to a surface
using point = basic_point<int>;

template <typename T, typename = typename std::enable_if_t<std::is_arithmetic<T>::value>>
struct basic_rect {
	T x{};
	T y{};
	T width{};
	T height{};

	constexpr basic_rect() noexcept = default;
	constexpr basic_rect(T x, T y, T width, T height) noexcept
		: x(x), y(y), width(width), height(height) {}

	constexpr basic_rect(const basic_point<T>& p, T width, T height) noexcept
		: x(p.x), y(p.y), width(width), height(height) {}

	basic_point<T> origin() const noexcept { return {x, y}; }

	T left() const noexcept { return x; }
	T top() const noexcept { return y; }
	T right() const noexcept { return x + width; }
	T bottom() const noexcept { return y + height; }

	friend bool operator==(const basic_rect& lhs, const basic_rect& rhs) noexcept {
		return lhs.x == rhs.x && lhs.y == rhs.y && lhs.width == rhs.width && lhs.height == rhs.height;
	}

	friend bool operator!=(const basic_rect& lhs, const basic_rect& rhs) noexcept {
		return !(lhs == rhs);
	}

	friend basic_rect operator+(const basic_rect& r, const basic_point<T>& p) noexcept {
		return {r.x + p.x, r.y + p.y, r.width, r.height};
	}

	friend basic_rect operator-(const basic_rect& r, const basic_point<T>& p) noexcept {
		return {r.x - p.x, r.y - p.y, r.width, r.height};
	}

	template <typename CharT>
	friend std::basic_ostream<CharT>& operator<<(std::basic_ostream<CharT>& os, const basic_rect& r) {
		os << '{' << r.x << ';' << r.y << ';' << r.width << ';' << r.height << '}';
		return os;
	}
};

using rect = basic_rect<int>;
using rectf = basic_rect<float>;

/// Closest pixel inside `r`; right and bottom are one past the last pixel
inline point clamp_point_to_rect(const point& p, const rect& r) {
	if (r.width <= 0 || r.height <= 0) {
		std::ostringstream ss;
		ss << "cannot clamp " << p << " to empty rect " << r;
		throw_error(errc::invalid_argument, ss.str());
	}
	return {
		std::max(r.left(), std::min(p.x, r.right() - 1)),
		std::max(r.top(), std::min(p.y, r.bottom() - 1))
	};
}

/// Side by side strips of equal width; for integer rects the leftover width
/// stays uncovered at the right
template <typename T>
inline std::vector<basic_rect<T>> split_rect_horizontally(const basic_rect<T>& r, int pieces) {
	if (pieces <= 0)
		throw_error(errc::invalid_argument, "rect must be split into at least one piece");

	const T step = r.width / static_cast<T>(pieces);

	std::vector<basic_rect<T>> result;
	result.reserve(pieces);
	for (int i = 0; i < pieces; ++i)
		result.emplace_back(r.x + static_cast<T>(i) * step, r.y, step, r.height);
	return result;
}

/// Stacked strips of equal height, see split_rect_horizontally
template <typename T>
inline std::vector<basic_rect<T>> split_rect_vertically(const basic_rect<T>& r, int pieces) {
	if (pieces <= 0)
		throw_error(errc::invalid_argument, "rect must be split into at least one piece");

	const T step = r.height / static_cast<T>(pieces);

	std::vector<basic_rect<T>> result;
	result.reserve(pieces);
	for (int i = 0; i < pieces; ++i)
		result.emplace_back(r.x, r.y + static_cast<T>(i) * step, r.width, step);
	return result;
}

class polar2;

///
/// 2D vector
///
/// Operators and named operations return new values, only the members spelled
/// `*_in_place`, `set_*` and compound assignments mutate.
///
class vector2 {
public:
	float x = 0.0f;
	float y = 0.0f;

	constexpr vector2() noexcept = default;
	constexpr vector2(float x, float y) noexcept
		: x(x), y(y) {}

	/// Vector of `length` pointing at `angle` radians
	static vector2 from_polar(float angle, float length) noexcept {
		return {std::cos(angle) * length, std::sin(angle) * length};
	}

	float magnitude() const noexcept { return std::sqrt(x * x + y * y); }
	float dot(const vector2& rhs) const noexcept { return x * rhs.x + y * rhs.y; }

	vector2 normalize() const;
	vector2 normalize_safe() const noexcept;
	vector2 rotate(float angle) const noexcept;

	/// Unsigned angle to `rhs` in radians
	float angle_between(const vector2& rhs) const;

	polar2 as_polar() const noexcept;

	/// Truncates toward zero
	point as_point() const noexcept { return {static_cast<int>(x), static_cast<int>(y)}; }

	void normalize_in_place() { *this = normalize(); }
	void rotate_in_place(float angle) noexcept { *this = rotate(angle); }
	void set_from_polar(float angle, float length) noexcept { *this = from_polar(angle, length); }
	void set_magnitude(float length) { *this = normalize() * length; }

	vector2 operator-() const noexcept { return {-x, -y}; }

	friend vector2 operator+(const vector2& lhs, const vector2& rhs) noexcept { return {lhs.x + rhs.x, lhs.y + rhs.y}; }
	friend vector2 operator-(const vector2& lhs, const vector2& rhs) noexcept { return {lhs.x - rhs.x, lhs.y - rhs.y}; }
	friend vector2 operator*(const vector2& v, float s) noexcept { return {v.x * s, v.y * s}; }
	friend vector2 operator*(float s, const vector2& v) noexcept { return {v.x * s, v.y * s}; }
	friend vector2 operator/(const vector2& v, float s) noexcept { return v * (1.0f / s); }

	vector2& operator+=(const vector2& rhs) noexcept { x += rhs.x; y += rhs.y; return *this; }
	vector2& operator-=(const vector2& rhs) noexcept { x -= rhs.x; y -= rhs.y; return *this; }
	vector2& operator*=(float s) noexcept { x *= s; y *= s; return *this; }

	friend bool operator==(const vector2& lhs, const vector2& rhs) noexcept {
		return lhs.x == rhs.x && lhs.y == rhs.y;
	}

	friend bool operator!=(const vector2& lhs, const vector2& rhs) noexcept {
		return !(lhs == rhs);
	}

	template <typename CharT>
	friend std::basic_ostream<CharT>& operator<<(std::basic_ostream<CharT>& os, const vector2& v) {
		os << '(' << v.x << ", " << v.y << ')';
		return os;
	}
};

///
/// 2D polar coordinates, angle in radians
///
class polar2 {
public:
	float theta = 0.0f;
	float radius = 0.0f;

	constexpr polar2() noexcept = default;
	constexpr polar2(float theta, float radius) noexcept
		: theta(theta), radius(radius) {}

	vector2 as_vector() const noexcept { return vector2::from_polar(theta, radius); }
};

////////////////////////////////////////////////////////////////////////////////
// vector2
//

inline vector2 vector2::normalize() const {
	const float length = magnitude();
	if (length == 0.0f) {
		std::ostringstream ss;
		ss << "cannot normalize zero-length vector " << *this;
		throw_error(errc::zero_length_vector, ss.str());
	}
	return *this / length;
}

inline vector2 vector2::normalize_safe() const noexcept {
	if (x == 0.0f && y == 0.0f)
		return *this;
	return *this / magnitude();
}

inline vector2 vector2::rotate(float angle) const noexcept {
	const float c = std::cos(angle);
	const float s = std::sin(angle);
	return {x * c - y * s, y * c + x * s};
}

inline float vector2::angle_between(const vector2& rhs) const {
	const float lengths = magnitude() * rhs.magnitude();
	if (lengths == 0.0f) {
		std::ostringstream ss;
		ss << "angle between " << *this << " and " << rhs << " is undefined";
		throw_error(errc::zero_length_vector, ss.str());
	}
	// Rounding may push the cosine slightly outside [-1, 1]
	const float cosine = std::max(-1.0f, std::min(dot(rhs) / lengths, 1.0f));
	return std::acos(cosine);
}

inline polar2 vector2::as_polar() const noexcept {
	return {std::atan2(y, x), magnitude()};
}

} // namespace ember

#endif // EMBER_GEOMETRY_HPP_INCLUDED

#ifndef EMBER_VECTOR3_HPP_INCLUDED
#define EMBER_VECTOR3_HPP_INCLUDED

#pragma once

// Types in this file:
//     vector3
//     matrix4
//
// Functions in this file:
//     to_vector3, to_vector2
//     normalize, angle_between, project_onto
//     translation, rotation_z, transform_point

#include <ember/geometry.hpp>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <sstream>
#include <string>
#include <cmath>
#include <algorithm>

namespace ember {

using vector3 = glm::vec3;

/// Column-major, m[column][row], vectors are columns so `a * b` applies b first
using matrix4 = glm::mat4;

/// Lift into the xy plane
inline vector3 to_vector3(const vector2& v) noexcept {
	return {v.x, v.y, 0.0f};
}

/// Drop z
inline vector2 to_vector2(const vector3& v) noexcept {
	return {v.x, v.y};
}

namespace detail {

inline std::string format_vector(const vector3& v) {
	std::ostringstream ss;
	ss << '(' << v.x << ", " << v.y << ", " << v.z << ')';
	return ss.str();
}

} // namespace detail

inline vector3 normalize(const vector3& v) {
	const float length = glm::length(v);
	if (length == 0.0f)
		throw_error(errc::zero_length_vector, "cannot normalize zero-length vector " + detail::format_vector(v));
	return v / length;
}

/// Unsigned angle between `a` and `b` in radians
inline float angle_between(const vector3& a, const vector3& b) {
	const float lengths = glm::length(a) * glm::length(b);
	if (lengths == 0.0f) {
		throw_error(errc::zero_length_vector,
			"angle between " + detail::format_vector(a) + " and " + detail::format_vector(b) + " is undefined");
	}
	const float cosine = std::max(-1.0f, std::min(glm::dot(a, b) / lengths, 1.0f));
	return std::acos(cosine);
}

/// Component of `v` along `onto`
inline vector3 project_onto(const vector3& v, const vector3& onto) {
	const float length_squared = glm::dot(onto, onto);
	if (length_squared == 0.0f)
		throw_error(errc::zero_length_vector, "cannot project " + detail::format_vector(v) + " onto a zero-length vector");
	return onto * (glm::dot(v, onto) / length_squared);
}

inline matrix4 translation(const vector3& d) {
	return glm::translate(matrix4(1.0f), d);
}

/// Rotation about the z axis, in the same direction as vector2::rotate
inline matrix4 rotation_z(float theta) {
	return glm::rotate(matrix4(1.0f), theta, vector3(0.0f, 0.0f, 1.0f));
}

/// Transform a point, w = 1
inline vector3 transform_point(const matrix4& m, const vector3& p) {
	return vector3(m * glm::vec4(p, 1.0f));
}

} // namespace ember

#endif // EMBER_VECTOR3_HPP_INCLUDED

#ifndef EMBER_COLLISION_HPP_INCLUDED
#define EMBER_COLLISION_HPP_INCLUDED

#pragma once

// Functions in this file:
//     point_in_circle
//     circles_touch
//     resolve_circle_to_circle
//     resolve_circle_to_static_circle

#include <ember/geometry.hpp>

#include <utility>

namespace ember {

/// Touching counts, so a point on the rim is inside
inline bool point_in_circle(const vector2& p, const vector2& center, float radius) noexcept {
	return (p - center).magnitude() <= radius;
}

inline bool circles_touch(const vector2& center1, float radius1, const vector2& center2, float radius2) noexcept {
	return (center1 - center2).magnitude() <= radius1 + radius2;
}

/// Share of speed a circle keeps when it bounces
constexpr float collision_damping = 0.5f;

/// New velocities for two colliding circles of equal mass
///
/// The circles swap velocities and lose speed by `damping`; positions and
/// radii play no part.
inline std::pair<vector2, vector2> resolve_circle_to_circle(const vector2& vel1, const vector2& vel2,
	float damping = collision_damping) noexcept
{
	return {vel2 * damping, vel1 * damping};
}

/// New velocity of a circle bouncing off a circle that never moves
inline vector2 resolve_circle_to_static_circle(const vector2& vel, float damping = collision_damping) noexcept {
	return -(vel * damping);
}

} // namespace ember

#endif // EMBER_COLLISION_HPP_INCLUDED

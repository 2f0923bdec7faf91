#ifndef EMBER_PARTICLES_HPP_INCLUDED
#define EMBER_PARTICLES_HPP_INCLUDED

#pragma once

#include <ember/particles_fwd.hpp>
#include <ember/actor.hpp>
#include <ember/surface.hpp>
#include <ember/logger.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <sstream>
#include <utility>
#include <cmath>

namespace ember {

namespace detail {

inline void check_positive(float value, const char* what) {
	if (!(value > 0.0f)) {
		std::stringstream ss;
		ss << what << " must be positive, got " << value;
		throw_error(errc::invalid_argument, ss.str());
	}
}

inline void check_bounds(float lo, float hi, const char* what) {
	if (hi < lo) {
		std::stringstream ss;
		ss << what << " range is reversed: " << lo << " > " << hi;
		throw_error(errc::invalid_argument, ss.str());
	}
}

} // namespace detail

////////////////////////////////////////////////////////////////////////////////
// burst_rate
//

inline burst_rate::burst_rate(int count)
	: _count(count)
{
	if (count < 0)
		throw_error(errc::invalid_argument, "burst count must not be negative");
}

inline int burst_rate::how_many(float) {
	if (_complete)
		throw_error(errc::invalid_state, "burst rate asked again after it fired");

	_complete = true;
	return _count;
}

////////////////////////////////////////////////////////////////////////////////
// constant_delay_rate
//

inline constant_delay_rate::constant_delay_rate(float delay)
	: _delay(delay)
{
	detail::check_positive(delay, "emission delay");
}

inline int constant_delay_rate::how_many(float dt) {
	const double total = dt + _carryover;
	const double count = std::floor(total / _delay);
	_carryover = std::max(0.0, total - count * _delay);
	return static_cast<int>(count);
}

////////////////////////////////////////////////////////////////////////////////
// random_delay_rate
//

inline random_delay_rate::random_delay_rate(float lo, float hi, ref_ptr<random_source> source)
	: _lo(lo)
	, _hi(hi)
	, _source(std::move(source))
{
	detail::check_positive(lo, "emission delay");
	detail::check_bounds(lo, hi, "emission delay");
	BOOST_ASSERT(_source);
	_delay = _source->uniform(_lo, _hi);
}

inline int random_delay_rate::how_many(float dt) {
	// Each interval gets its own delay, drawn when the previous one is used up
	_carryover += dt;

	int count = 0;
	while (_carryover >= _delay) {
		_carryover -= _delay;
		_delay = _source->uniform(_lo, _hi);
		++count;
	}

	return count;
}

////////////////////////////////////////////////////////////////////////////////
// timed_random_delay_rate
//

inline timed_random_delay_rate::timed_random_delay_rate(float lo, float hi, float lifetime, ref_ptr<random_source> source)
	: random_delay_rate(lo, hi, std::move(source))
	, _lifetime_remaining(lifetime)
{
}

inline int timed_random_delay_rate::how_many(float dt) {
	_lifetime_remaining -= dt;
	return random_delay_rate::how_many(dt);
}

////////////////////////////////////////////////////////////////////////////////
// speed, direction, lifetime, color
//

inline random_speed::random_speed(float lo, float hi, ref_ptr<random_source> source)
	: _lo(lo)
	, _hi(hi)
	, _source(std::move(source))
{
	detail::check_bounds(lo, hi, "speed");
	BOOST_ASSERT(_source);
}

inline any_direction::any_direction(ref_ptr<random_source> source)
	: _source(std::move(source))
{
	BOOST_ASSERT(_source);
}

inline spread_direction::spread_direction(float angle, float half_spread, ref_ptr<random_source> source)
	: _angle(angle)
	, _half_spread(half_spread)
	, _source(std::move(source))
{
	if (half_spread < 0.0f)
		throw_error(errc::invalid_argument, "direction spread must not be negative");
	BOOST_ASSERT(_source);
}

inline constant_lifetime::constant_lifetime(float lifetime)
	: _lifetime(lifetime)
{
	detail::check_positive(lifetime, "particle lifetime");
}

inline random_lifetime::random_lifetime(float lo, float hi, ref_ptr<random_source> source)
	: _lo(lo)
	, _hi(hi)
	, _source(std::move(source))
{
	detail::check_positive(lo, "particle lifetime");
	detail::check_bounds(lo, hi, "particle lifetime");
	BOOST_ASSERT(_source);
}

inline color_choice::color_choice(std::vector<color> choices, ref_ptr<random_source> source)
	: _choices(std::move(choices))
	, _source(std::move(source))
{
	if (_choices.empty())
		throw_error(errc::empty_choice, "color choice needs at least one color");
	BOOST_ASSERT(_source);
}

////////////////////////////////////////////////////////////////////////////////
// point_attract_field
//

inline point_attract_field::point_attract_field(const vector2& point, float magnitude) noexcept
	: _point(point)
	, _magnitude(magnitude)
{
}

inline point_attract_field::point_attract_field(const vector2& point, float magnitude, float falloff_radius)
	: _point(point)
	, _magnitude(magnitude)
	, _falloff_radius(falloff_radius)
{
	detail::check_positive(falloff_radius, "falloff radius");
}

inline vector2 point_attract_field::get_accel(const vector2& position, const vector2&) noexcept {
	const vector2 to_point = _point - position;

	if (!_falloff_radius)
		return to_point.normalize_safe() * _magnitude;

	const float radius = *_falloff_radius;
	const float distance = to_point.magnitude();
	if (distance >= radius)
		return {};

	return to_point.normalize_safe() * (_magnitude * (radius - distance) / radius);
}

////////////////////////////////////////////////////////////////////////////////
// turbulence_field
//

inline turbulence_field::turbulence_field(float frequency, float magnitude, ref_ptr<random_source> source)
	: _frequency(frequency)
	, _magnitude(magnitude)
	, _source(std::move(source))
{
	if (frequency < 0.0f || frequency > 1.0f)
		throw_error(errc::invalid_argument, "turbulence frequency must lie in [0, 1]");
	BOOST_ASSERT(_source);
}

inline vector2 turbulence_field::get_accel(const vector2&, const vector2&) {
	if (_source->uniform01() >= _frequency)
		return {};

	return random_direction(*_source) * _magnitude;
}

////////////////////////////////////////////////////////////////////////////////
// particle
//

inline particle::particle(const vector2& position, const vector2& velocity, float lifetime, const color& c, int size)
	: _position(position)
	, _velocity(velocity)
	, _lifetime_remaining(lifetime)
	, _color(c)
	, _size(size)
{
	detail::check_positive(lifetime, "particle lifetime");
	if (size < 0)
		throw_error(errc::invalid_argument, "particle size must not be negative");
}

inline void particle::step(float dt) {
	BOOST_ASSERT_MSG(_lifetime_remaining > 0.0f, "stepping a dead particle");

	_position += _velocity * dt;
	_lifetime_remaining = std::max(0.0f, _lifetime_remaining - dt);
}

inline void particle::draw(surface& s) {
	if (_size == 0)
		s.draw_point(_position.as_point(), _color);
	else
		s.draw_circle(_position.as_point(), _size, _color);
}

////////////////////////////////////////////////////////////////////////////////
// emitter
//

inline emitter::emitter(const vector2& position,
	std::unique_ptr<emitter_rate> rate,
	std::unique_ptr<emitter_speed> speed,
	std::unique_ptr<emitter_direction> direction,
	std::unique_ptr<emitter_lifetime> lifetime,
	std::unique_ptr<emitter_color> color_policy,
	int start_size,
	std::unique_ptr<emitter_field> field)
	: _position(position)
	, _rate(std::move(rate))
	, _speed(std::move(speed))
	, _direction(std::move(direction))
	, _lifetime(std::move(lifetime))
	, _color(std::move(color_policy))
	, _field(std::move(field))
	, _start_size(start_size)
{
	if (!_rate || !_speed || !_direction || !_lifetime || !_color)
		throw_error(errc::invalid_argument, "emitter is missing a required policy");
	if (start_size < 0)
		throw_error(errc::invalid_argument, "particle size must not be negative");

	EM_LOGD("emitter created at " << _position << (_field ? " with field" : ""));
}

inline void emitter::step(float dt) {
	if (can_reap())
		throw_error(errc::invalid_state, "stepping an emitter that is already done");

	if (_can_emit && !_rate->is_complete())
		emit(dt);

	if (!_rate_completed && _rate->is_complete()) {
		_rate_completed = true;
		EM_LOGD("emitter at " << _position << " finished emitting, " << _particles.size() << " particles left");
	}

	// Semi-implicit Euler: velocity first, then position in particle::step
	if (_field) {
		_particles.for_each([&](particle& p) {
			p.velocity(p.velocity() + _field->get_accel(p.position(), p.velocity()) * dt);
		});
	}

	_particles.step(dt);
}

inline void emitter::emit(float dt) {
	const int count = _rate->how_many(dt);

	for (int i = 0; i < count; ++i) {
		const float speed = _speed->get_speed();
		const vector2 velocity = _direction->get_direction() * speed;
		const float lifetime = _lifetime->get_lifetime();
		const color c = _color->get_color();

		_particles.append(make_ref<particle>(_position, velocity, lifetime, c, _start_size));
	}
}

inline void emitter::draw(surface& s) {
	_particles.draw(s);
}

inline bool emitter::can_reap() const noexcept {
	return _reaped || (_rate->is_complete() && _particles.empty());
}

inline void emitter::reap() {
	_can_emit = false;
	_reaped = true;
	_particles.reap();
}

} // namespace ember

#endif // EMBER_PARTICLES_HPP_INCLUDED

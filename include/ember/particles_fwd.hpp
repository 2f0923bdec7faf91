#ifndef EMBER_PARTICLES_FWD_HPP_INCLUDED
#define EMBER_PARTICLES_FWD_HPP_INCLUDED

#pragma once

// Classes in this file:
//     emitter_rate
//         burst_rate
//         constant_delay_rate
//         random_delay_rate
//         timed_random_delay_rate
//     emitter_speed
//         constant_speed
//         random_speed
//     emitter_direction
//         any_direction
//         constant_direction
//         spread_direction
//     emitter_lifetime
//         constant_lifetime
//         random_lifetime
//     emitter_color
//         constant_color
//         color_choice
//     emitter_field
//         constant_field
//         drag_field
//         point_attract_field
//         turbulence_field
//     particle
//     emitter

#include <ember/actor_fwd.hpp>
#include <ember/geometry.hpp>
#include <ember/color.hpp>
#include <ember/random.hpp>

#include <boost/optional.hpp>

#include <memory>
#include <vector>

namespace ember {

////////////////////////////////////////////////////////////////////////////////
// Emission rate
//

/// How many particles to emit per step, and when to stop
class emitter_rate {
public:
	virtual ~emitter_rate() = default;

	/// Number of particles to emit for a step of `dt` seconds
	virtual int how_many(float dt) = 0;

	/// Once complete the emitter never asks again
	virtual bool is_complete() const = 0;
};

/// Emits everything on the first step
class burst_rate : public emitter_rate {
public:
	explicit burst_rate(int count);

	int how_many(float dt) override;
	bool is_complete() const noexcept override { return _complete; }

private:
	int _count;
	bool _complete = false;
};

/// One particle every `delay` seconds, forever
///
/// Time left over after the last emission carries into the next step, so the
/// long-run rate stays at 1/delay however the frame time varies.
class constant_delay_rate : public emitter_rate {
public:
	explicit constant_delay_rate(float delay);

	int how_many(float dt) override;
	bool is_complete() const noexcept override { return false; }

	double carryover() const noexcept { return _carryover; }

private:
	float _delay;
	double _carryover = 0.0;
};

/// Like constant_delay_rate, but every interval lasts a random delay from [lo, hi]
class random_delay_rate : public emitter_rate {
public:
	random_delay_rate(float lo, float hi, ref_ptr<random_source> source = random_source::default_source());

	int how_many(float dt) override;
	bool is_complete() const noexcept override { return false; }

private:
	float _lo;
	float _hi;
	ref_ptr<random_source> _source;
	float _delay;
	double _carryover = 0.0;
};

/// random_delay_rate that completes after emitting for `lifetime` seconds
class timed_random_delay_rate : public random_delay_rate {
public:
	timed_random_delay_rate(float lo, float hi, float lifetime, ref_ptr<random_source> source = random_source::default_source());

	int how_many(float dt) override;
	bool is_complete() const noexcept override { return _lifetime_remaining <= 0.0f; }

	float lifetime_remaining() const noexcept { return _lifetime_remaining; }

private:
	float _lifetime_remaining;
};

////////////////////////////////////////////////////////////////////////////////
// Initial speed (no direction)
//

class emitter_speed {
public:
	virtual ~emitter_speed() = default;
	virtual float get_speed() = 0;
};

class constant_speed : public emitter_speed {
public:
	explicit constant_speed(float speed) noexcept : _speed(speed) {}
	float get_speed() noexcept override { return _speed; }

private:
	float _speed;
};

class random_speed : public emitter_speed {
public:
	random_speed(float lo, float hi, ref_ptr<random_source> source = random_source::default_source());
	float get_speed() override { return _source->uniform(_lo, _hi); }

private:
	float _lo;
	float _hi;
	ref_ptr<random_source> _source;
};

////////////////////////////////////////////////////////////////////////////////
// Initial direction, always a unit vector
//

class emitter_direction {
public:
	virtual ~emitter_direction() = default;
	virtual vector2 get_direction() = 0;
};

/// Anywhere on the full circle
class any_direction : public emitter_direction {
public:
	explicit any_direction(ref_ptr<random_source> source = random_source::default_source());
	vector2 get_direction() override { return random_direction(*_source); }

private:
	ref_ptr<random_source> _source;
};

class constant_direction : public emitter_direction {
public:
	/// Throws errc::zero_length_vector for a zero direction
	explicit constant_direction(const vector2& direction)
		: _direction(direction.normalize())
	{
	}

	vector2 get_direction() noexcept override { return _direction; }

private:
	vector2 _direction;
};

/// Within `half_spread` radians either side of `angle`
class spread_direction : public emitter_direction {
public:
	spread_direction(float angle, float half_spread, ref_ptr<random_source> source = random_source::default_source());
	vector2 get_direction() override { return random_direction_with_spread(*_source, _angle, _half_spread); }

private:
	float _angle;
	float _half_spread;
	ref_ptr<random_source> _source;
};

////////////////////////////////////////////////////////////////////////////////
// Initial lifetime
//

class emitter_lifetime {
public:
	virtual ~emitter_lifetime() = default;
	virtual float get_lifetime() = 0;
};

class constant_lifetime : public emitter_lifetime {
public:
	explicit constant_lifetime(float lifetime);
	float get_lifetime() noexcept override { return _lifetime; }

private:
	float _lifetime;
};

class random_lifetime : public emitter_lifetime {
public:
	random_lifetime(float lo, float hi, ref_ptr<random_source> source = random_source::default_source());
	float get_lifetime() override { return _source->uniform(_lo, _hi); }

private:
	float _lo;
	float _hi;
	ref_ptr<random_source> _source;
};

////////////////////////////////////////////////////////////////////////////////
// Initial color
//

class emitter_color {
public:
	virtual ~emitter_color() = default;
	virtual color get_color() = 0;
};

class constant_color : public emitter_color {
public:
	explicit constant_color(const color& c) noexcept : _color(c) {}
	color get_color() noexcept override { return _color; }

private:
	color _color;
};

/// Uniform pick from a fixed, non-empty set
class color_choice : public emitter_color {
public:
	explicit color_choice(std::vector<color> choices, ref_ptr<random_source> source = random_source::default_source());
	color get_color() override { return random_choice(*_source, _choices); }

	const std::vector<color>& choices() const noexcept { return _choices; }

private:
	std::vector<color> _choices;
	ref_ptr<random_source> _source;
};

////////////////////////////////////////////////////////////////////////////////
// Fields acting on live particles
//

/// Maps a particle's position and velocity to an acceleration
class emitter_field {
public:
	virtual ~emitter_field() = default;
	virtual vector2 get_accel(const vector2& position, const vector2& velocity) = 0;
};

/// Same acceleration everywhere, e.g. gravity
class constant_field : public emitter_field {
public:
	explicit constant_field(const vector2& accel) noexcept : _accel(accel) {}
	vector2 get_accel(const vector2&, const vector2&) noexcept override { return _accel; }

private:
	vector2 _accel;
};

/// Slows particles down, 0 means no drag
///
/// Returns the velocity scaled by -k as an acceleration, so the decay per
/// step depends on the frame time.
class drag_field : public emitter_field {
public:
	explicit drag_field(float k = 0.99f) noexcept : _k(k) {}
	vector2 get_accel(const vector2&, const vector2& velocity) noexcept override { return -(velocity * _k); }

private:
	float _k;
};

/// Pulls toward a point, or pushes away with a negative magnitude
///
/// With a falloff radius the pull fades linearly to zero at that distance and
/// is zero beyond it.
class point_attract_field : public emitter_field {
public:
	point_attract_field(const vector2& point, float magnitude) noexcept;
	/// Throws errc::invalid_argument unless `falloff_radius` is positive
	point_attract_field(const vector2& point, float magnitude, float falloff_radius);

	vector2 get_accel(const vector2& position, const vector2& velocity) noexcept override;

private:
	vector2 _point;
	float _magnitude;
	boost::optional<float> _falloff_radius;
};

/// Random kicks: with probability `frequency` per call a push of `magnitude` in a random direction
class turbulence_field : public emitter_field {
public:
	turbulence_field(float frequency, float magnitude, ref_ptr<random_source> source = random_source::default_source());

	vector2 get_accel(const vector2& position, const vector2& velocity) override;

private:
	float _frequency;
	float _magnitude;
	ref_ptr<random_source> _source;
};

////////////////////////////////////////////////////////////////////////////////
// particle
//

///
/// A single simulated point, created by an emitter
///
/// Drawn as a pixel when size is 0, as a circle of that radius otherwise.
///
class particle : public actor {
public:
	particle(const vector2& position, const vector2& velocity, float lifetime, const color& c, int size);

	const vector2& position() const noexcept { return _position; }

	const vector2& velocity() const noexcept { return _velocity; }
	void velocity(const vector2& v) noexcept { _velocity = v; }

	float lifetime_remaining() const noexcept { return _lifetime_remaining; }
	const color& get_color() const noexcept { return _color; }
	int size() const noexcept { return _size; }

	void step(float dt) override;
	void draw(surface& s) override;
	bool can_reap() const noexcept override { return _lifetime_remaining <= 0.0f; }
	void reap() noexcept override { _lifetime_remaining = 0.0f; }

private:
	vector2 _position;
	vector2 _velocity;
	float _lifetime_remaining;
	color _color;
	int _size;
};

////////////////////////////////////////////////////////////////////////////////
// emitter
//

///
/// Spawns and manages particles according to its policies
///
/// Every policy but the field is required. The emitter can be reaped once its
/// rate is complete and all of its particles have died, or after reap().
///
class emitter : public actor {
public:
	emitter(const vector2& position,
		std::unique_ptr<emitter_rate> rate,
		std::unique_ptr<emitter_speed> speed,
		std::unique_ptr<emitter_direction> direction,
		std::unique_ptr<emitter_lifetime> lifetime,
		std::unique_ptr<emitter_color> color_policy,
		int start_size,
		std::unique_ptr<emitter_field> field = nullptr);

	/// Origin of future particles, live particles are not affected
	const vector2& position() const noexcept { return _position; }
	void position(const vector2& p) noexcept { _position = p; }

	void start() noexcept { _can_emit = true; }
	void stop() noexcept { _can_emit = false; }
	bool emitting() const noexcept { return _can_emit; }

	const emitter_rate& rate() const noexcept { return *_rate; }
	const actor_list<particle>& particles() const noexcept { return _particles; }

	void step(float dt) override;
	void draw(surface& s) override;
	bool can_reap() const noexcept override;

	/// Kill every particle and stop emitting for good
	void reap() override;

private:
	void emit(float dt);

private:
	vector2 _position;

	std::unique_ptr<emitter_rate> _rate;
	std::unique_ptr<emitter_speed> _speed;
	std::unique_ptr<emitter_direction> _direction;
	std::unique_ptr<emitter_lifetime> _lifetime;
	std::unique_ptr<emitter_color> _color;
	std::unique_ptr<emitter_field> _field;

	int _start_size;
	bool _can_emit = true;
	bool _reaped = false;
	bool _rate_completed = false;

	actor_list<particle> _particles;
};

} // namespace ember

#endif // EMBER_PARTICLES_FWD_HPP_INCLUDED

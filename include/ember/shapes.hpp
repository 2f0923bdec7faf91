#ifndef EMBER_SHAPES_HPP_INCLUDED
#define EMBER_SHAPES_HPP_INCLUDED

#pragma once

// Classes in this file:
//     lifetime_actor
//     dot
//     circle
//     line
//     filled_rect
//     sprite
//     alpha_rect
//     growing_circle
//     pulse_circle
//     screen_fader
//
// Simple shapes with a lifetime, mostly useful for debug drawing.

#include <ember/actor.hpp>
#include <ember/surface.hpp>
#include <ember/waves.hpp>

#include <sstream>

namespace ember {

///
/// Base for actors that die after a fixed number of seconds
///
class lifetime_actor : public actor {
public:
	explicit lifetime_actor(float lifetime) noexcept
		: _lifetime_remaining(lifetime)
	{
	}

	float lifetime_remaining() const noexcept { return _lifetime_remaining; }

	void step(float dt) override { _lifetime_remaining -= dt; }
	bool can_reap() const noexcept override { return _lifetime_remaining <= 0.0f; }
	void reap() noexcept override { _lifetime_remaining = 0.0f; }

private:
	float _lifetime_remaining;
};

class dot : public lifetime_actor {
public:
	dot(const vector2& position, const color& c, float lifetime) noexcept
		: lifetime_actor(lifetime)
		, _position(position)
		, _color(c)
	{
	}

	void draw(surface& s) override { s.draw_point(_position.as_point(), _color); }

private:
	vector2 _position;
	color _color;
};

class circle : public lifetime_actor {
public:
	circle(const vector2& position, int radius, const color& c, float lifetime) noexcept
		: lifetime_actor(lifetime)
		, _position(position)
		, _radius(radius)
		, _color(c)
	{
	}

	void draw(surface& s) override { s.draw_circle(_position.as_point(), _radius, _color); }

private:
	vector2 _position;
	int _radius;
	color _color;
};

class line : public lifetime_actor {
public:
	line(const vector2& from, const vector2& to, const color& c, float lifetime) noexcept
		: lifetime_actor(lifetime)
		, _from(from)
		, _to(to)
		, _color(c)
	{
	}

	void draw(surface& s) override { s.draw_line(_from.as_point(), _to.as_point(), _color); }

private:
	vector2 _from;
	vector2 _to;
	color _color;
};

class filled_rect : public lifetime_actor {
public:
	filled_rect(const rect& r, const color& c, float lifetime) noexcept
		: lifetime_actor(lifetime)
		, _rect(r)
		, _color(c)
	{
	}

	void draw(surface& s) override { s.fill_rect(_rect, _color); }

private:
	rect _rect;
	color _color;
};

class sprite : public lifetime_actor {
public:
	sprite(const image_name& image, const vector2& position, float lifetime)
		: lifetime_actor(lifetime)
		, _image(image)
		, _position(position)
	{
	}

	void position(const vector2& p) noexcept { _position = p; }

	void draw(surface& s) override { s.blit(_image, _position.as_point()); }

private:
	image_name _image;
	vector2 _position;
};

///
/// Translucent rectangle that stays until its owner clears it
///
class alpha_rect : public actor {
public:
	alpha_rect(const rect& r, const color& c) noexcept
		: _rect(r)
		, _color(c)
	{
	}

	void step(float) noexcept override {}
	void draw(surface& s) override { s.fill_rect(_rect, _color); }
	bool can_reap() const noexcept override { return false; }

private:
	rect _rect;
	color _color;
};

///
/// Circle whose radius goes from `start_radius` to `end_radius` over its lifetime
///
class growing_circle : public lifetime_actor {
public:
	growing_circle(const vector2& position, float start_radius, float end_radius, const color& c, float lifetime)
		: lifetime_actor(lifetime)
		, _position(position)
		, _start_radius(start_radius)
		, _end_radius(end_radius)
		, _radius(start_radius)
		, _total_lifetime(lifetime)
		, _color(c)
	{
		if (lifetime <= 0.0f) {
			std::ostringstream ss;
			ss << "growing_circle lifetime must be positive, got " << lifetime;
			throw_error(errc::invalid_argument, ss.str());
		}
	}

	float radius() const noexcept { return _radius; }

	void step(float dt) override {
		lifetime_actor::step(dt);
		_radius = lerp(_end_radius, _start_radius, lifetime_remaining() / _total_lifetime);
	}

	void draw(surface& s) override { s.draw_circle(_position.as_point(), static_cast<int>(_radius), _color); }

private:
	vector2 _position;
	float _start_radius;
	float _end_radius;
	float _radius;
	float _total_lifetime;
	color _color;
};

///
/// Circle with radius driven by a wave over elapsed time, a zero lifetime loops forever
///
class pulse_circle : public actor {
public:
	pulse_circle(const vector2& position, const sine_wave& radius_curve, const color& c, float lifetime = 0.0f) noexcept
		: _position(position)
		, _radius_curve(radius_curve)
		, _color(c)
		, _looping(lifetime == 0.0f)
		, _lifetime_remaining(lifetime)
	{
	}

	float radius() const noexcept { return _radius_curve.get(_elapsed); }

	void step(float dt) noexcept override {
		_lifetime_remaining -= dt;
		_elapsed += dt;
	}

	void draw(surface& s) override { s.draw_circle(_position.as_point(), static_cast<int>(radius()), _color); }

	bool can_reap() const noexcept override { return !_looping && _lifetime_remaining <= 0.0f; }

	void reap() noexcept override {
		_looping = false;
		_lifetime_remaining = 0.0f;
	}

private:
	vector2 _position;
	sine_wave _radius_curve;
	color _color;
	bool _looping;
	float _lifetime_remaining;
	float _elapsed = 0.0f;
};

///
/// Full-surface fade between two alpha values over `length` seconds
///
class screen_fader : public actor {
public:
	screen_fader(const rect& area, const color& c, float length, int start_alpha, int end_alpha)
		: _area(area)
		, _color(c)
		, _length(length)
		, _start_alpha(static_cast<float>(start_alpha))
		, _end_alpha(static_cast<float>(end_alpha))
		, _alpha(static_cast<float>(start_alpha))
	{
		auto check_alpha = [](const char* name, int alpha) {
			if (alpha < 0 || alpha > 255) {
				std::ostringstream ss;
				ss << "screen_fader " << name << " of " << alpha << " must be between 0 and 255";
				throw_error(errc::invalid_color, ss.str());
			}
		};

		check_alpha("start_alpha", start_alpha);
		check_alpha("end_alpha", end_alpha);

		if (length < 0.0f) {
			std::ostringstream ss;
			ss << "screen_fader length must not be negative, got " << length;
			throw_error(errc::invalid_argument, ss.str());
		}
	}

	uint8_t alpha() const noexcept { return static_cast<uint8_t>(_alpha); }

	void step(float dt) noexcept override {
		_elapsed += dt;
		const float u = _length > 0.0f ? clamp(_elapsed / _length, 0.0f, 1.0f) : 1.0f;
		_alpha = lerp(_start_alpha, _end_alpha, u);
	}

	void draw(surface& s) override { s.fill_rect(_area, _color.with_alpha(alpha())); }

	bool can_reap() const noexcept override { return _elapsed >= _length; }

private:
	rect _area;
	color _color;
	float _length;
	float _start_alpha;
	float _end_alpha;
	float _alpha;
	float _elapsed = 0.0f;
};

} // namespace ember

#endif // EMBER_SHAPES_HPP_INCLUDED

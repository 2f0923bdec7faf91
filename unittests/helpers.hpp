#ifndef EMBER_UNITTESTS_HELPERS_HPP_INCLUDED
#define EMBER_UNITTESTS_HELPERS_HPP_INCLUDED

#pragma once

#include <ember/actor.hpp>
#include <ember/error.hpp>
#include <ember/surface.hpp>
#include <ember/random.hpp>

#include <functional>
#include <string>
#include <system_error>
#include <vector>

namespace ember {
namespace test {

/// Remembers every primitive it was asked to draw
class recording_surface : public surface {
public:
	void draw_point(const point& p, const color& c) override {
		_points.push_back(p);
		_colors.push_back(c);
	}

	void draw_circle(const point& center, int radius, const color& c) override {
		_circles.push_back(center);
		_radii.push_back(radius);
		_colors.push_back(c);
	}

	void draw_line(const point&, const point&, const color& c) override {
		++_lines;
		_colors.push_back(c);
	}

	void fill_rect(const rect& r, const color& c) override {
		_rects.push_back(r);
		_colors.push_back(c);
	}

	void blit(const image_name& image, const point& p) override {
		_images.push_back(image.get());
		_points.push_back(p);
	}

	size_t primitives() const noexcept {
		return _points.size() + _circles.size() + _lines + _rects.size();
	}

	void clear() {
		_points.clear();
		_circles.clear();
		_radii.clear();
		_rects.clear();
		_images.clear();
		_colors.clear();
		_lines = 0;
	}

	std::vector<point> _points;
	std::vector<point> _circles;
	std::vector<int> _radii;
	std::vector<rect> _rects;
	std::vector<std::string> _images;
	std::vector<color> _colors;
	size_t _lines = 0;
};

/// Replays a fixed sequence of values, wrapping around at the end
class scripted_random_source : public random_source {
public:
	explicit scripted_random_source(std::vector<float> values, std::vector<size_t> indices = {0})
		: _values(std::move(values))
		, _indices(std::move(indices))
	{
	}

	float uniform01() override {
		const float v = _values[_next_value];
		_next_value = (_next_value + 1) % _values.size();
		return v;
	}

	size_t choose_index(size_t count) override {
		const size_t i = _indices[_next_index];
		_next_index = (_next_index + 1) % _indices.size();
		return i % count;
	}

private:
	std::vector<float> _values;
	std::vector<size_t> _indices;
	size_t _next_value = 0;
	size_t _next_index = 0;
};

/// Dies after a fixed number of steps and remembers what happened to it
class counting_actor : public actor {
public:
	explicit counting_actor(int steps_to_live) noexcept
		: _steps_to_live(steps_to_live)
	{
	}

	void step(float) noexcept override {
		++_steps;
		--_steps_to_live;
	}

	void draw(surface&) noexcept override { ++_draws; }
	bool can_reap() const noexcept override { return _steps_to_live <= 0; }
	void reap() noexcept override { _reaped = true; }

	int _steps_to_live;
	int _steps = 0;
	int _draws = 0;
	bool _reaped = false;
};

/// True when `fn` throws a std::system_error carrying `expected`
inline bool throws_code(errc expected, const std::function<void()>& fn) {
	try {
		fn();
	} catch (const std::system_error& e) {
		return e.code() == expected;
	}
	return false;
}

} // namespace test
} // namespace ember

#endif // EMBER_UNITTESTS_HELPERS_HPP_INCLUDED

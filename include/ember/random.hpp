#ifndef EMBER_RANDOM_HPP_INCLUDED
#define EMBER_RANDOM_HPP_INCLUDED

#pragma once

// Classes in this file:
//     random_source
//     mt_random_source
//     no_repeat_picker<>
//     cycling_picker<>
//
// Functions in this file:
//     random_vector
//     random_in_rect
//     random_in_circle
//     random_direction
//     random_direction_with_spread
//     random_choice
//     random_color

#include <ember/geometry.hpp>
#include <ember/color.hpp>
#include <ember/math.hpp>
#include <ember/utility/intrusive.hpp>

#include <boost/assert.hpp>
#include <boost/optional.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_real_distribution.hpp>
#include <boost/random/uniform_int_distribution.hpp>

#include <vector>
#include <utility>
#include <sstream>
#include <cstdint>

namespace ember {

///
/// Source of uniform random numbers
///
/// Everything random in ember draws from one of these so that a seeded or
/// scripted source makes a simulation reproducible.
///
class random_source : public ref_counter<random_source> {
public:
	virtual ~random_source() = default;

	/// Uniform value in [0, 1)
	virtual float uniform01() = 0;

	/// Uniform value between `lo` and `hi`
	float uniform(float lo, float hi) { return lo + (hi - lo) * uniform01(); }

	/// Uniform index in [0, count), count must be positive
	virtual size_t choose_index(size_t count) = 0;

	/// Shared process-wide source, seeded once from the default seed
	static ref_ptr<random_source> default_source();
};

///
/// Mersenne twister backed source
///
class mt_random_source : public random_source {
public:
	static constexpr uint32_t default_seed = 5489u;

	explicit mt_random_source(uint32_t seed = default_seed)
		: _engine(seed)
	{
	}

	void seed(uint32_t seed) { _engine.seed(seed); }

	float uniform01() override {
		return boost::random::uniform_real_distribution<float>(0.0f, 1.0f)(_engine);
	}

	size_t choose_index(size_t count) override {
		if (!count)
			throw_error(errc::empty_choice, "choose_index from an empty set");
		return boost::random::uniform_int_distribution<size_t>(0, count - 1)(_engine);
	}

private:
	boost::random::mt19937 _engine;
};

inline ref_ptr<random_source> random_source::default_source() {
	static ref_ptr<random_source> instance = make_ref<mt_random_source>();
	return instance;
}

////////////////////////////////////////////////////////////////////////////////
// Randomized vectors
//

/// Centered on the origin, spanning `xrange` by `yrange`
inline vector2 random_vector(random_source& rnd, float xrange, float yrange) {
	return {rnd.uniform01() * xrange - xrange / 2.0f, rnd.uniform01() * yrange - yrange / 2.0f};
}

inline vector2 random_vector(random_source& rnd, float xmin, float xmax, float ymin, float ymax) {
	return {rnd.uniform(xmin, xmax), rnd.uniform(ymin, ymax)};
}

inline vector2 random_in_rect(random_source& rnd, const rectf& r) {
	return {rnd.uniform01() * r.width + r.x, rnd.uniform01() * r.height + r.y};
}

/// Radius is drawn uniformly rather than by area, so points bunch toward the center
inline vector2 random_in_circle(random_source& rnd, const vector2& center, float radius) {
	const float angle = two_pi * rnd.uniform01();
	const float r = radius * rnd.uniform01();
	return center + vector2::from_polar(angle, r);
}

inline vector2 random_direction(random_source& rnd) {
	return vector2::from_polar(rnd.uniform(0.0f, two_pi), 1.0f);
}

/// Unit vector within `half_spread` radians either side of `angle`
inline vector2 random_direction_with_spread(random_source& rnd, float angle, float half_spread) {
	return vector2::from_polar(angle + rnd.uniform(-half_spread, half_spread), 1.0f);
}

template <typename T>
inline const T& random_choice(random_source& rnd, const std::vector<T>& items) {
	return items[rnd.choose_index(items.size())];
}

/// Opaque color with every channel drawn uniformly
inline color random_color(random_source& rnd) {
	return {
		static_cast<uint8_t>(rnd.choose_index(256)),
		static_cast<uint8_t>(rnd.choose_index(256)),
		static_cast<uint8_t>(rnd.choose_index(256))
	};
}

////////////////////////////////////////////////////////////////////////////////
// Endless item pickers
//

///
/// Random picks that never give the same item twice in a row
///
/// With a single item, or when every other item equals the last pick, the
/// last pick is repeated.
///
template <typename T>
class no_repeat_picker {
public:
	explicit no_repeat_picker(std::vector<T> items, ref_ptr<random_source> source = random_source::default_source())
		: _items(std::move(items))
		, _source(std::move(source))
	{
		if (_items.empty())
			throw_error(errc::empty_choice, "no_repeat_picker needs at least one item");
		BOOST_ASSERT(_source);
	}

	const T& next() {
		if (!_last) {
			_last = _source->choose_index(_items.size());
			return _items[*_last];
		}

		_candidates.clear();
		for (size_t i = 0; i < _items.size(); ++i) {
			if (!(_items[i] == _items[*_last]))
				_candidates.push_back(i);
		}

		if (!_candidates.empty())
			_last = _candidates[_source->choose_index(_candidates.size())];

		return _items[*_last];
	}

private:
	std::vector<T> _items;
	ref_ptr<random_source> _source;
	boost::optional<size_t> _last;
	std::vector<size_t> _candidates;
};

/// Items in order, starting over after the last one
template <typename T>
class cycling_picker {
public:
	explicit cycling_picker(std::vector<T> items)
		: _items(std::move(items))
	{
		if (_items.empty())
			throw_error(errc::empty_choice, "cycling_picker needs at least one item");
	}

	const T& next() noexcept {
		const T& item = _items[_index];
		_index = (_index + 1) % _items.size();
		return item;
	}

private:
	std::vector<T> _items;
	size_t _index = 0;
};

} // namespace ember

#endif // EMBER_RANDOM_HPP_INCLUDED

#ifndef EMBER_TIMERS_HPP_INCLUDED
#define EMBER_TIMERS_HPP_INCLUDED

#pragma once

// Classes in this file:
//     timer_manager
//     frame_timer
//     stopwatch

#include <ember/error.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <chrono>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

namespace ember {

///
/// Deferred callbacks driven by frame time
///
class timer_manager {
public:
	using callback_type = std::function<void()>;

	timer_manager() noexcept = default;

	timer_manager(const timer_manager&) = delete;
	timer_manager& operator=(const timer_manager&) = delete;

	/// Call `callback` once more than `delay` seconds of frame time have passed
	void add(float delay, callback_type callback);

	/// Advance time and fire expired timers in the order they were added
	void step(float dt);

	float elapsed() const noexcept { return _elapsed; }
	size_t pending() const noexcept { return _timers.size(); }
	bool empty() const noexcept { return _timers.empty(); }

private:
	struct timer {
		float trigger_time;
		callback_type callback;
	};

	std::vector<timer> _timers;
	float _elapsed = 0.0f;
};

///
/// Measures the time between frames
///
class frame_timer {
public:
	using clock_type = std::chrono::steady_clock;

	frame_timer() noexcept
		: _start(clock_type::now())
		, _last(_start)
	{
	}

	/// @return Seconds since the previous tick
	float tick() noexcept {
		++_ticks;
		const auto now = clock_type::now();
		const std::chrono::duration<float> delta = now - _last;
		_last = now;
		return delta.count();
	}

	/// Seconds between construction and the last tick
	float total_time() const noexcept {
		return std::chrono::duration<float>(_last - _start).count();
	}

	size_t total_ticks() const noexcept { return _ticks; }

	/// Average frames per second since construction
	float total_fps() const {
		const float total = total_time();
		if (total <= 0.0f)
			throw_error(errc::invalid_state, "frame rate is undefined before any time has elapsed");
		return _ticks / total;
	}

private:
	clock_type::time_point _start;
	clock_type::time_point _last;
	size_t _ticks = 0;
};

///
/// Measures how long something takes
///
class stopwatch {
public:
	using clock_type = std::chrono::steady_clock;

	stopwatch() noexcept { reset(); }

	void reset() noexcept { _start = clock_type::now(); }

	/// Seconds since construction or the last reset
	float elapsed() const noexcept {
		return std::chrono::duration<float>(clock_type::now() - _start).count();
	}

private:
	clock_type::time_point _start;
};

////////////////////////////////////////////////////////////////////////////////
// timer_manager
//

inline void timer_manager::add(float delay, callback_type callback) {
	BOOST_ASSERT(callback);
	_timers.push_back({_elapsed + delay, std::move(callback)});
}

inline void timer_manager::step(float dt) {
	_elapsed += dt;

	// Detach expired timers first, a callback is free to add new ones
	auto first_pending = std::stable_partition(_timers.begin(), _timers.end(),
		[this](const timer& t) { return !(t.trigger_time < _elapsed); });

	std::vector<timer> expired(std::make_move_iterator(first_pending), std::make_move_iterator(_timers.end()));
	_timers.erase(first_pending, _timers.end());

	for (auto&& t : expired)
		t.callback();
}

} // namespace ember

#endif // EMBER_TIMERS_HPP_INCLUDED

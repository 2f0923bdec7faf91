#ifndef EMBER_WAVES_HPP_INCLUDED
#define EMBER_WAVES_HPP_INCLUDED

#pragma once

// Classes in this file:
//     sine_wave
//     pulse_wave

#include <ember/math.hpp>

#include <sstream>
#include <cmath>

namespace ember {

namespace detail {

inline void check_unit_parameter(const char* wave, const char* name, float value) {
	if (value < 0.0f || value > 1.0f) {
		std::ostringstream ss;
		ss << wave << ' ' << name << " is " << value << " but must be between 0 and 1";
		throw_error(errc::invalid_argument, ss.str());
	}
}

inline void check_wavelength(const char* wave, float wavelength) {
	if (wavelength == 0.0f) {
		std::ostringstream ss;
		ss << wave << " wavelength must not be zero";
		throw_error(errc::division_by_zero, ss.str());
	}
}

} // namespace detail

///
/// Sine wave spanning `amplitude` over `wavelength` units, phase shift in [0, 1]
///
class sine_wave {
public:
	sine_wave(float wavelength, const range& amplitude, float phase_shift = 0.0f)
		: _wavelength(wavelength)
		, _half_span(amplitude.span() / 2.0f)
		, _mid(amplitude.mid())
		, _phase_shift(phase_shift)
	{
		detail::check_wavelength("sine_wave", wavelength);
		detail::check_unit_parameter("sine_wave", "phase_shift", phase_shift);
	}

	float get(float t) const noexcept {
		return _half_span * std::sin(two_pi * t / _wavelength + two_pi * _phase_shift) + _mid;
	}

private:
	float _wavelength;
	float _half_span;
	float _mid;
	float _phase_shift;
};

///
/// Square wave that stays at `amplitude.lo()` for the first `pulse_width` of each period
///
class pulse_wave {
public:
	pulse_wave(float wavelength, const range& amplitude, float phase_shift = 0.0f, float pulse_width = 0.5f)
		: _wavelength(wavelength)
		, _lo(amplitude.lo())
		, _hi(amplitude.hi())
		, _phase_shift(phase_shift)
		, _pulse_width(pulse_width)
	{
		detail::check_wavelength("pulse_wave", wavelength);
		detail::check_unit_parameter("pulse_wave", "phase_shift", phase_shift);
		detail::check_unit_parameter("pulse_wave", "pulse_width", pulse_width);
	}

	float get(float t) const noexcept {
		float whole;
		const float fractional = std::modf(t / _wavelength + _phase_shift, &whole);
		return fractional < _pulse_width ? _lo : _hi;
	}

private:
	float _wavelength;
	float _lo;
	float _hi;
	float _phase_shift;
	float _pulse_width;
};

} // namespace ember

#endif // EMBER_WAVES_HPP_INCLUDED

#ifndef EMBER_COLOR_HPP_INCLUDED
#define EMBER_COLOR_HPP_INCLUDED

#pragma once

// Classes in this file:
//     color
//     color_table

#include <ember/error.hpp>

#include <boost/flyweight.hpp>

#include <initializer_list>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <map>
#include <cstdint>

namespace ember {

///
/// RGBA color, 8 bits per channel
///
class color {
public:
	constexpr color() noexcept = default;
	constexpr color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) noexcept
		: _r(r), _g(g), _b(b), _a(a) {}

	/// Checked construction from wider integers, each component must be in [0, 255]
	static color from_components(int r, int g, int b, int a = 255);

	constexpr uint8_t red() const noexcept { return _r; }
	constexpr uint8_t green() const noexcept { return _g; }
	constexpr uint8_t blue() const noexcept { return _b; }
	constexpr uint8_t alpha() const noexcept { return _a; }

	constexpr color with_alpha(uint8_t a) const noexcept { return {_r, _g, _b, a}; }

	friend constexpr bool operator==(const color& lhs, const color& rhs) noexcept {
		return lhs._r == rhs._r && lhs._g == rhs._g && lhs._b == rhs._b && lhs._a == rhs._a;
	}

	friend constexpr bool operator!=(const color& lhs, const color& rhs) noexcept {
		return !(lhs == rhs);
	}

	friend std::ostream& operator<<(std::ostream& os, const color& c) {
		os << "rgba(" << int(c._r) << ", " << int(c._g) << ", " << int(c._b) << ", " << int(c._a) << ')';
		return os;
	}

private:
	uint8_t _r = 255;
	uint8_t _g = 255;
	uint8_t _b = 255;
	uint8_t _a = 255;
};

struct color_name_tag {};

using color_name = boost::flyweight<std::string, boost::flyweights::tag<color_name_tag>>;

///
/// Immutable table of named colors
///
/// Built once at start up and passed by reference to whatever needs named
/// colors.
///
class color_table {
public:
	color_table(std::initializer_list<std::pair<const char*, color>> entries);

	/// Table with the usual web color names (white, red, navyblue, gold, ...)
	static const color_table& standard();

	/// Throws errc::resource_not_found for unknown names
	const color& find(const color_name& name) const;
	const color& find(const char* name) const { return find(color_name(name)); }

	bool contains(const color_name& name) const noexcept { return _colors.count(name) != 0; }
	size_t size() const noexcept { return _colors.size(); }

private:
	std::map<color_name, color> _colors;
};

////////////////////////////////////////////////////////////////////////////////
// color
//

inline color color::from_components(int r, int g, int b, int a) {
	auto valid = [](int c) { return c >= 0 && c <= 255; };
	if (!valid(r) || !valid(g) || !valid(b) || !valid(a)) {
		std::ostringstream ss;
		ss << "color components (" << r << ", " << g << ", " << b << ", " << a << ") must be in [0, 255]";
		throw_error(errc::invalid_color, ss.str());
	}
	return {static_cast<uint8_t>(r), static_cast<uint8_t>(g), static_cast<uint8_t>(b), static_cast<uint8_t>(a)};
}

////////////////////////////////////////////////////////////////////////////////
// color_table
//

inline color_table::color_table(std::initializer_list<std::pair<const char*, color>> entries) {
	for (auto&& entry : entries)
		_colors.emplace(color_name(entry.first), entry.second);
}

inline const color_table& color_table::standard() {
	static const color_table table{
		{"white",     {255, 255, 255}},
		{"lightgray", {211, 211, 211}},
		{"gray",      {190, 190, 190}},
		{"darkgray",  {169, 169, 169}},
		{"black",     {0, 0, 0}},
		{"ivory",     {255, 255, 240}},
		{"maroon",    {176, 48, 96}},
		{"red",       {255, 0, 0}},
		{"green",     {0, 255, 0}},
		{"blue",      {0, 0, 255}},
		{"navyblue",  {0, 0, 128}},
		{"cyan",      {0, 255, 255}},
		{"magenta",   {255, 0, 255}},
		{"yellow",    {255, 255, 0}},
		{"orange",    {255, 165, 0}},
		{"violet",    {238, 130, 238}},
		{"purple",    {160, 32, 240}},
		{"olivedrab", {107, 142, 35}},
		{"beige",     {245, 245, 220}},
		{"brown",     {165, 42, 42}},
		{"tan",       {210, 180, 140}},
		{"pink",      {255, 192, 203}},
		{"gold",      {255, 215, 0}},
	};
	return table;
}

inline const color& color_table::find(const color_name& name) const {
	auto it = _colors.find(name);
	if (it == _colors.end()) {
		EM_LOGW("unknown color name '" << name.get() << '\'');
		throw_error(errc::resource_not_found, "no color named '" + name.get() + "'");
	}
	return (*it).second;
}

} // namespace ember

#endif // EMBER_COLOR_HPP_INCLUDED

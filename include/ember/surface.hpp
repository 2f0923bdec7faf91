#ifndef EMBER_SURFACE_HPP_INCLUDED
#define EMBER_SURFACE_HPP_INCLUDED

#pragma once

// Classes in this file:
//     surface

#include <ember/geometry.hpp>
#include <ember/color.hpp>

#include <boost/flyweight.hpp>

#include <string>

namespace ember {

struct image_name_tag {};

using image_name = boost::flyweight<std::string, boost::flyweights::tag<image_name_tag>>;

///
/// Drawing sink implemented by the host renderer
///
/// ember only ever calls into it from draw(), never reads it back.
///
class surface {
public:
	virtual ~surface() = default;

	virtual void draw_point(const point& p, const color& c) = 0;
	virtual void draw_circle(const point& center, int radius, const color& c) = 0;
	virtual void draw_line(const point& from, const point& to, const color& c) = 0;
	virtual void fill_rect(const rect& r, const color& c) = 0;

	/// Copy a host-registered image with its top left corner at `p`
	virtual void blit(const image_name& image, const point& p) = 0;
};

} // namespace ember

#endif // EMBER_SURFACE_HPP_INCLUDED

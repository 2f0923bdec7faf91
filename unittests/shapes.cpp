#include <catch2/catch.hpp>
#include <ember/shapes.hpp>

#include "helpers.hpp"

using namespace ember;
using namespace ember::test;

TEST_CASE("shapes", "[shapes]") {
	recording_surface s;
	const color red(255, 0, 0);

	SECTION("lifetime shapes die on time") {
		actor_list<> list;
		list.append(make_ref<dot>(vector2(1, 2), red, 0.5f));
		list.append(make_ref<circle>(vector2(3, 4), 5, red, 1.0f));
		list.append(make_ref<line>(vector2(0, 0), vector2(10, 10), red, 1.5f));
		list.append(make_ref<filled_rect>(rect(0, 0, 4, 4), red, 2.0f));

		list.draw(s);
		REQUIRE(s._points.size() == 1);
		REQUIRE(s._circles.size() == 1);
		REQUIRE(s._radii.front() == 5);
		REQUIRE(s._lines == 1);
		REQUIRE(s._rects.size() == 1);

		list.step(0.5f);
		REQUIRE(list.size() == 3);
		list.step(0.5f);
		REQUIRE(list.size() == 2);
		list.step(1.0f);
		REQUIRE(list.empty());
	}

	SECTION("sprite blits its image") {
		auto sp = make_ref<sprite>(image_name("spark.png"), vector2(7.5f, 8.5f), 1.0f);
		sp->draw(s);
		sp->position(vector2(1, 1));
		sp->draw(s);

		REQUIRE(s._images.size() == 2);
		REQUIRE(s._images.front() == "spark.png");
		REQUIRE(s._points.front() == point(7, 8));
		REQUIRE(s._points.back() == point(1, 1));
	}

	SECTION("alpha rect stays") {
		alpha_rect r(rect(0, 0, 10, 10), red.with_alpha(64));
		r.step(100.0f);
		REQUIRE_FALSE(r.can_reap());
		r.draw(s);
		REQUIRE(s._colors.back().alpha() == 64);
	}

	SECTION("reap cuts the lifetime short") {
		circle c(vector2(0, 0), 1, red, 10.0f);
		REQUIRE_FALSE(c.can_reap());
		c.reap();
		REQUIRE(c.can_reap());
	}
}

TEST_CASE("growing circle", "[shapes]") {
	growing_circle c(vector2(0, 0), 2.0f, 10.0f, color(), 4.0f);
	REQUIRE(c.radius() == Approx(2.0f));

	c.step(1.0f);
	REQUIRE(c.radius() == Approx(4.0f));

	c.step(3.0f);
	REQUIRE(c.radius() == Approx(10.0f));
	REQUIRE(c.can_reap());

	REQUIRE_THROWS_AS(growing_circle(vector2(0, 0), 1.0f, 2.0f, color(), 0.0f), std::system_error);
}

TEST_CASE("pulse circle", "[shapes]") {
	const sine_wave wave(2.0f, range(1.0f, 3.0f));

	SECTION("looping") {
		pulse_circle c(vector2(0, 0), wave, color());
		REQUIRE(c.radius() == Approx(2.0f));
		c.step(0.5f);
		REQUIRE(c.radius() == Approx(3.0f));
		c.step(100.0f);
		REQUIRE_FALSE(c.can_reap());

		c.reap();
		REQUIRE(c.can_reap());
	}

	SECTION("limited") {
		pulse_circle c(vector2(0, 0), wave, color(), 1.0f);
		c.step(0.5f);
		REQUIRE_FALSE(c.can_reap());
		c.step(0.5f);
		REQUIRE(c.can_reap());
	}
}

TEST_CASE("screen fader", "[shapes]") {
	recording_surface s;

	SECTION("fades over its length") {
		screen_fader f(rect(0, 0, 640, 480), color(0, 0, 0), 2.0f, 0, 200);
		f.step(1.0f);
		REQUIRE(f.alpha() == 100);
		REQUIRE_FALSE(f.can_reap());

		f.step(1.5f);
		REQUIRE(f.alpha() == 200);
		REQUIRE(f.can_reap());

		f.draw(s);
		REQUIRE(s._rects.back() == rect(0, 0, 640, 480));
		REQUIRE(s._colors.back() == color(0, 0, 0, 200));
	}

	SECTION("zero length jumps to the end") {
		screen_fader f(rect(0, 0, 1, 1), color(), 0.0f, 255, 0);
		REQUIRE(f.can_reap());
		f.step(0.016f);
		REQUIRE(f.alpha() == 0);
	}

	SECTION("invalid parameters") {
		REQUIRE_THROWS_AS(screen_fader(rect(), color(), 1.0f, -1, 0), std::system_error);
		REQUIRE_THROWS_AS(screen_fader(rect(), color(), 1.0f, 0, 256), std::system_error);
		REQUIRE_THROWS_AS(screen_fader(rect(), color(), -1.0f, 0, 255), std::system_error);
	}
}

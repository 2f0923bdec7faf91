#include <catch2/catch.hpp>
#include <ember/geometry.hpp>
#include <ember/collision.hpp>
#include <ember/math.hpp>

#include <sstream>

using namespace ember;

TEST_CASE("geometry", "[geometry]") {
	rect r{1, 1, 10, 10};

	SECTION("rect extents") {
		REQUIRE(r.origin() == (point(1, 1)));
		REQUIRE(r.left() == 1);
		REQUIRE(r.top() == 1);
		REQUIRE(r.right() == 11);
		REQUIRE(r.bottom() == 11);
	}

	SECTION("rect operators") {
		REQUIRE((r + point(1, 2)) == (rect(2, 3, 10, 10)));
		REQUIRE((r - point(1, 2)) == (rect(0, -1, 10, 10)));
	}
}

TEST_CASE("vector2", "[geometry]") {
	const vector2 v{3.0f, 4.0f};

	SECTION("arithmetic") {
		REQUIRE(v + vector2(1, 1) == vector2(4, 5));
		REQUIRE(v - vector2(1, 1) == vector2(2, 3));
		REQUIRE(v * 2.0f == vector2(6, 8));
		REQUIRE(2.0f * v == vector2(6, 8));
		REQUIRE(v / 2.0f == vector2(1.5f, 2.0f));
		REQUIRE(-v == vector2(-3, -4));
		REQUIRE(v.dot(vector2(1, 0)) == Approx(3.0f));
		REQUIRE(v.magnitude() == Approx(5.0f));
	}

	SECTION("operations return new values") {
		vector2 w = v;
		auto n = w.normalize();
		REQUIRE(w == v);
		REQUIRE(n.x == Approx(0.6f));
		REQUIRE(n.y == Approx(0.8f));
		REQUIRE(n.magnitude() == Approx(1.0f));

		w.normalize_in_place();
		REQUIRE(w == n);

		w += vector2(1, 1);
		w *= 2.0f;
		REQUIRE(w.x == Approx(3.2f));
		REQUIRE(w.y == Approx(3.6f));
	}

	SECTION("zero length") {
		const vector2 zero;
		REQUIRE_THROWS_AS(zero.normalize(), std::system_error);
		REQUIRE(zero.normalize_safe() == zero);
		REQUIRE_THROWS_AS(zero.angle_between(v), std::system_error);

		vector2 w;
		REQUIRE_THROWS_AS(w.set_magnitude(2.0f), std::system_error);
	}

	SECTION("rotation is counterclockwise") {
		auto rotated = vector2(1, 0).rotate(pi / 2.0f);
		REQUIRE(rotated.x == Approx(0.0f).margin(1e-6));
		REQUIRE(rotated.y == Approx(1.0f));
	}

	SECTION("angles") {
		REQUIRE(vector2(1, 0).angle_between(vector2(0, 1)) == Approx(pi / 2.0f));
		REQUIRE(vector2(1, 0).angle_between(vector2(-2, 0)) == Approx(pi));
		REQUIRE(vector2(1, 1).angle_between(vector2(2, 2)) == Approx(0.0f).margin(1e-3));
	}

	SECTION("polar") {
		auto p = vector2(0, 2).as_polar();
		REQUIRE(p.theta == Approx(pi / 2.0f));
		REQUIRE(p.radius == Approx(2.0f));

		auto back = p.as_vector();
		REQUIRE(back.x == Approx(0.0f).margin(1e-6));
		REQUIRE(back.y == Approx(2.0f));

		vector2 w;
		w.set_from_polar(pi, 3.0f);
		REQUIRE(w.x == Approx(-3.0f));
	}

	SECTION("as point truncates") {
		REQUIRE(vector2(1.9f, -1.9f).as_point() == point(1, -1));
	}

	SECTION("output") {
		std::ostringstream ss;
		ss << vector2(1, 2);
		REQUIRE(ss.str() == "(1, 2)");
	}
}

TEST_CASE("collision", "[geometry]") {
	SECTION("point in circle includes the rim") {
		REQUIRE(point_in_circle({3, 4}, {0, 0}, 5.0f));
		REQUIRE_FALSE(point_in_circle({3, 4.1f}, {0, 0}, 5.0f));
	}

	SECTION("touching circles") {
		REQUIRE(circles_touch({0, 0}, 1.0f, {2, 0}, 1.0f));
		REQUIRE_FALSE(circles_touch({0, 0}, 1.0f, {2.5f, 0}, 1.0f));
	}

	SECTION("moving circles swap damped velocities") {
		auto v = resolve_circle_to_circle({4, 0}, {-2, 2});
		REQUIRE(v.first == vector2(-1, 1));
		REQUIRE(v.second == vector2(2, 0));

		v = resolve_circle_to_circle({4, 0}, {-2, 2}, 1.0f);
		REQUIRE(v.first == vector2(-2, 2));
	}

	SECTION("bounce off a static circle") {
		REQUIRE(resolve_circle_to_static_circle({4, -2}) == vector2(-2, 1));
		REQUIRE(resolve_circle_to_static_circle({4, -2}, 0.25f) == vector2(-1, 0.5f));
	}
}

TEST_CASE("rect utilities", "[geometry]") {
	const rect screen{0, 0, 640, 480};

	SECTION("clamp keeps the right and bottom edge outside") {
		REQUIRE(clamp_point_to_rect({10, 20}, screen) == point(10, 20));
		REQUIRE(clamp_point_to_rect({-5, 500}, screen) == point(0, 479));
		REQUIRE(clamp_point_to_rect({640, 480}, screen) == point(639, 479));
		REQUIRE(clamp_point_to_rect({0, 0}, rect{5, 5, 1, 1}) == point(5, 5));
		REQUIRE_THROWS_AS(clamp_point_to_rect({0, 0}, rect{0, 0, 0, 10}), std::system_error);
	}

	SECTION("horizontal split leaves the remainder uncovered") {
		auto pieces = split_rect_horizontally(rect{0, 0, 8, 10}, 3);
		REQUIRE(pieces.size() == 3);
		REQUIRE(pieces[0] == rect(0, 0, 2, 10));
		REQUIRE(pieces[1] == rect(2, 0, 2, 10));
		REQUIRE(pieces[2] == rect(4, 0, 2, 10));
	}

	SECTION("vertical split of a float rect is exact") {
		auto pieces = split_rect_vertically(rectf{1.0f, 2.0f, 5.0f, 9.0f}, 3);
		REQUIRE(pieces.size() == 3);
		REQUIRE(pieces[2].y == Approx(8.0f));
		REQUIRE(pieces[2].height == Approx(3.0f));
		REQUIRE(pieces[2].x == 1.0f);
		REQUIRE(pieces[2].width == 5.0f);
	}

	SECTION("at least one piece") {
		REQUIRE_THROWS_AS(split_rect_horizontally(screen, 0), std::system_error);
		REQUIRE_THROWS_AS(split_rect_vertically(screen, -1), std::system_error);
	}
}

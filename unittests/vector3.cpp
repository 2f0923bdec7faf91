#include <catch2/catch.hpp>
#include <ember/vector3.hpp>
#include <ember/math.hpp>

#include "helpers.hpp"

using namespace ember;
using namespace ember::test;

TEST_CASE("vector3", "[geometry]") {
	SECTION("checked normalize") {
		const vector3 n = normalize(vector3(0, 3, 4));
		REQUIRE(n.x == 0.0f);
		REQUIRE(n.y == Approx(0.6f));
		REQUIRE(n.z == Approx(0.8f));
		REQUIRE(throws_code(errc::zero_length_vector, [] { normalize(vector3()); }));
	}

	SECTION("angle and projection") {
		REQUIRE(angle_between(vector3(1, 0, 0), vector3(0, 0, 1)) == Approx(pi / 2.0f));
		REQUIRE(angle_between(vector3(1, 1, 0), vector3(2, 2, 0)) == Approx(0.0f).margin(1e-3));
		REQUIRE(throws_code(errc::zero_length_vector, [] { angle_between(vector3(1, 0, 0), vector3()); }));

		const vector3 p = project_onto(vector3(3, 4, 5), vector3(0, 2, 0));
		REQUIRE(p.x == 0.0f);
		REQUIRE(p.y == 4.0f);
		REQUIRE(p.z == 0.0f);
		REQUIRE(throws_code(errc::zero_length_vector, [] { project_onto(vector3(1, 2, 3), vector3()); }));
	}

	SECTION("to and from the xy plane") {
		const vector3 v = to_vector3(vector2(1, 2));
		REQUIRE(v.z == 0.0f);
		REQUIRE(to_vector2(v) == vector2(1, 2));
	}
}

TEST_CASE("matrix4", "[geometry]") {
	const vector3 p{1, 2, 3};

	SECTION("translation moves points") {
		const vector3 r = transform_point(translation({10, 20, 30}), p);
		REQUIRE(r.x == 11.0f);
		REQUIRE(r.y == 22.0f);
		REQUIRE(r.z == 33.0f);
	}

	SECTION("rotation about z agrees with vector2::rotate") {
		const vector3 r = transform_point(rotation_z(pi / 2.0f), vector3(1, 0, 5));
		const vector2 expected = vector2(1, 0).rotate(pi / 2.0f);
		REQUIRE(r.x == Approx(expected.x).margin(1e-6));
		REQUIRE(r.y == Approx(expected.y));
		REQUIRE(r.z == Approx(5.0f));
	}

	SECTION("product applies the right operand first") {
		const vector3 r = transform_point(translation({1, 0, 0}) * rotation_z(pi), vector3(1, 0, 0));
		REQUIRE(r.x == Approx(0.0f).margin(1e-6));
		REQUIRE(r.y == Approx(0.0f).margin(1e-6));
	}
}

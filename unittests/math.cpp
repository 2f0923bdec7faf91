#include <catch2/catch.hpp>
#include <ember/math.hpp>
#include <ember/geometry.hpp>
#include <ember/waves.hpp>

#include <sstream>
#include <vector>

using namespace ember;

TEST_CASE("range", "[math]") {
	SECTION("include grows both ends") {
		range r;
		r.include(5).include(-3);
		REQUIRE(r.lo() == -3.0f);
		REQUIRE(r.hi() == 5.0f);
		REQUIRE(r.span() == 8.0f);
		REQUIRE(r.mid() == 1.0f);

		r.include(0.0f);
		REQUIRE(r.lo() == -3.0f);
		REQUIRE(r.hi() == 5.0f);
	}

	SECTION("uninitialized") {
		range r;
		REQUIRE_FALSE(r.initialized());
		REQUIRE_THROWS_AS(r.lo(), std::system_error);
		REQUIRE_THROWS_AS(r.span(), std::system_error);
		REQUIRE_THROWS_AS(r.contains(1.0f), std::system_error);

		try {
			r.hi();
			FAIL("hi() on an empty range must throw");
		} catch (const std::system_error& e) {
			REQUIRE(e.code() == errc::uninitialized_range);
		}
	}

	SECTION("reversed bounds") {
		range r(10.0f, 2.0f);
		REQUIRE(r.lo() == 2.0f);
		REQUIRE(r.hi() == 10.0f);
	}

	SECTION("containment and clamping") {
		range r(0.0f, 10.0f);
		REQUIRE(r.contains(0.0f));
		REQUIRE(r.contains(10.0f));
		REQUIRE_FALSE(r.contains(10.5f));
		REQUIRE(r.clamp(-1.0f) == 0.0f);
		REQUIRE(r.clamp(11.0f) == 10.0f);
		REQUIRE(r.clamp_hi(11.0f) == 10.0f);
		REQUIRE(r.clamp_lo(-1.0f) == 0.0f);
	}

	SECTION("include range") {
		range r(0.0f, 1.0f);
		r.include_range(range(-2.0f, 0.5f));
		REQUIRE(r.lo() == -2.0f);
		REQUIRE(r.hi() == 1.0f);
		REQUIRE_THROWS_AS(r.include_range(range()), std::system_error);
	}

	SECTION("output") {
		std::ostringstream ss;
		ss << range() << ' ' << range(1.0f, 2.0f);
		REQUIRE(ss.str() == "(<empty range>) (1 -> 2)");
	}
}

TEST_CASE("interpolation", "[math]") {
	SECTION("lerp") {
		REQUIRE(lerp(0.0f, 10.0f, 0.25f) == Approx(2.5f));
		auto v = lerp(vector2(0, 0), vector2(10, 20), 0.5f);
		REQUIRE(v == vector2(5, 10));
	}

	SECTION("inverse lerp") {
		REQUIRE(inverse_lerp(75.0f, 0.0f, 100.0f) == Approx(0.75f));
		REQUIRE(inverse_lerp(25.0f, 100.0f, 0.0f) == Approx(0.75f));
		REQUIRE(inverse_lerp(150.0f, 0.0f, 100.0f) == Approx(1.5f));
		REQUIRE(inverse_lerp(-50.0f, 0.0f, 100.0f) == Approx(-0.5f));
	}

	SECTION("inverse lerp on an empty interval") {
		try {
			inverse_lerp(1.0f, 5.0f, 5.0f);
			FAIL("expected division by zero");
		} catch (const std::system_error& e) {
			REQUIRE(e.code() == errc::division_by_zero);
		}
	}

	SECTION("quadratic passes through its control points") {
		REQUIRE(quadratic_interp(1.0f, 5.0f, 2.0f, 0.0f) == Approx(1.0f));
		REQUIRE(quadratic_interp(1.0f, 5.0f, 2.0f, 0.5f) == Approx(5.0f));
		REQUIRE(quadratic_interp(1.0f, 5.0f, 2.0f, 1.0f) == Approx(2.0f));
	}

	SECTION("bilinear corners and center") {
		REQUIRE(bilinear_interp(0.0f, 1.0f, 2.0f, 3.0f, 0.0f, 0.0f) == Approx(0.0f));
		REQUIRE(bilinear_interp(0.0f, 1.0f, 2.0f, 3.0f, 1.0f, 0.0f) == Approx(1.0f));
		REQUIRE(bilinear_interp(0.0f, 1.0f, 2.0f, 3.0f, 1.0f, 1.0f) == Approx(2.0f));
		REQUIRE(bilinear_interp(0.0f, 1.0f, 2.0f, 3.0f, 0.0f, 1.0f) == Approx(3.0f));
		REQUIRE(bilinear_interp(0.0f, 1.0f, 2.0f, 3.0f, 0.5f, 0.5f) == Approx(1.5f));
	}
}

TEST_CASE("nearest multiple", "[math]") {
	REQUIRE(nearest_multiple(6, 4) == 8);
	REQUIRE(nearest_multiple(5, 4) == 4);
	REQUIRE(nearest_multiple(-120, 90) == -90);
	REQUIRE(nearest_multiple(100, 90) == 90);
	REQUIRE(nearest_multiple(0.7, 0.5) == Approx(0.5));
	REQUIRE_THROWS_AS(nearest_multiple(5, 0), std::system_error);
}

TEST_CASE("number theory", "[math]") {
	REQUIRE(gcd(12, 18) == 6);
	REQUIRE(gcd(7, 5) == 1);

	std::vector<long> values{4, 6, 10};
	REQUIRE(lcm(values.begin(), values.end()) == 60);

	std::vector<long> none;
	REQUIRE_THROWS_AS(lcm(none.begin(), none.end()), std::system_error);
}

TEST_CASE("float comparison", "[math]") {
	REQUIRE(approx_equal(1.0f, 1.00001f));
	REQUIRE_FALSE(approx_equal(1.0f, 1.001f));

	const float third = 1.0f / 3.0f;
	REQUIRE(almost_equal(third * 3.0f, 1.0f));
	REQUIRE(almost_equal(-0.0f, 0.0f));
	REQUIRE_FALSE(almost_equal(1.0f, 1.1f));
}

TEST_CASE("waves", "[math]") {
	SECTION("sine wave spans the amplitude") {
		sine_wave wave(4.0f, range(2.0f, 6.0f));
		REQUIRE(wave.get(0.0f) == Approx(4.0f));
		REQUIRE(wave.get(1.0f) == Approx(6.0f));
		REQUIRE(wave.get(3.0f) == Approx(2.0f));
		REQUIRE(wave.get(4.0f) == Approx(4.0f).margin(1e-5));
	}

	SECTION("sine phase shift") {
		sine_wave wave(4.0f, range(2.0f, 6.0f), 0.25f);
		REQUIRE(wave.get(0.0f) == Approx(6.0f));
	}

	SECTION("pulse wave") {
		pulse_wave wave(2.0f, range(0.0f, 1.0f), 0.0f, 0.25f);
		REQUIRE(wave.get(0.0f) == 0.0f);
		REQUIRE(wave.get(0.4f) == 0.0f);
		REQUIRE(wave.get(0.6f) == 1.0f);
		REQUIRE(wave.get(1.9f) == 1.0f);
		REQUIRE(wave.get(2.1f) == 0.0f);
	}

	SECTION("invalid parameters") {
		REQUIRE_THROWS_AS(sine_wave(0.0f, range(0.0f, 1.0f)), std::system_error);
		REQUIRE_THROWS_AS(sine_wave(1.0f, range(0.0f, 1.0f), 1.5f), std::system_error);
		REQUIRE_THROWS_AS(pulse_wave(1.0f, range(0.0f, 1.0f), 0.0f, -0.1f), std::system_error);
		REQUIRE_THROWS_AS(sine_wave(1.0f, range()), std::system_error);
	}
}

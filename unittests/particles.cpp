#include <catch2/catch.hpp>
#include <ember/particles.hpp>

#include "helpers.hpp"

#include <cmath>
#include <cstdlib>

using namespace ember;
using namespace ember::test;

TEST_CASE("burst rate", "[particles]") {
	burst_rate rate(5);
	REQUIRE_FALSE(rate.is_complete());
	REQUIRE(rate.how_many(123.0f) == 5);
	REQUIRE(rate.is_complete());
	REQUIRE(throws_code(errc::invalid_state, [&] { rate.how_many(0.1f); }));

	REQUIRE(throws_code(errc::invalid_argument, [] { burst_rate{-1}; }));
}

TEST_CASE("constant delay rate", "[particles]") {
	SECTION("leftover time carries over") {
		constant_delay_rate rate(0.25f);
		REQUIRE(rate.how_many(0.125f) == 0);
		REQUIRE(rate.how_many(0.125f) == 1);
		REQUIRE(rate.carryover() == Approx(0.0));
		REQUIRE(rate.how_many(0.375f) == 1);
		REQUIRE(rate.carryover() == Approx(0.125));
		REQUIRE(rate.how_many(0.625f) == 3);
		REQUIRE_FALSE(rate.is_complete());
	}

	SECTION("long run rate converges whatever the frame times") {
		mt_random_source rnd(2024);

		for (float delay : {0.01f, 0.033f, 0.1f, 0.7f}) {
			constant_delay_rate rate(delay);
			double total_time = 0.0;
			long total_count = 0;

			for (int frame = 0; frame < 2000; ++frame) {
				const float dt = rnd.uniform(0.0005f, 0.05f);
				total_time += dt;
				total_count += rate.how_many(dt);
			}

			const long expected = static_cast<long>(std::floor(total_time / delay));
			REQUIRE(std::abs(total_count - expected) <= 1);
		}
	}

	SECTION("delay must be positive") {
		REQUIRE(throws_code(errc::invalid_argument, [] { constant_delay_rate{0.0f}; }));
		REQUIRE(throws_code(errc::invalid_argument, [] { constant_delay_rate{-1.0f}; }));
	}
}

TEST_CASE("random delay rate", "[particles]") {
	SECTION("new delay for every interval") {
		// Delays alternate between lo and hi
		auto rnd = make_ref<scripted_random_source>(std::vector<float>{0.0f, 1.0f});
		random_delay_rate rate(0.5f, 1.0f, rnd);

		REQUIRE(rate.how_many(0.5f) == 1);
		REQUIRE(rate.how_many(0.5f) == 0);
		REQUIRE(rate.how_many(0.5f) == 1);
		REQUIRE(rate.how_many(1.5f) == 2);
		REQUIRE_FALSE(rate.is_complete());
	}

	SECTION("invalid bounds") {
		REQUIRE(throws_code(errc::invalid_argument, [] { random_delay_rate{0.0f, 1.0f}; }));
		REQUIRE(throws_code(errc::invalid_argument, [] { random_delay_rate{2.0f, 1.0f}; }));
	}

	SECTION("timed rate completes") {
		auto rnd = make_ref<scripted_random_source>(std::vector<float>{0.0f});
		timed_random_delay_rate rate(0.25f, 0.5f, 1.0f, rnd);

		REQUIRE(rate.how_many(0.5f) == 2);
		REQUIRE_FALSE(rate.is_complete());
		REQUIRE(rate.how_many(0.5f) == 2);
		REQUIRE(rate.is_complete());
		REQUIRE(rate.lifetime_remaining() <= 0.0f);
	}
}

TEST_CASE("particle attribute policies", "[particles]") {
	SECTION("speed") {
		constant_speed fixed(3.0f);
		REQUIRE(fixed.get_speed() == 3.0f);

		auto rnd = make_ref<scripted_random_source>(std::vector<float>{0.5f});
		random_speed ranged(10.0f, 20.0f, rnd);
		REQUIRE(ranged.get_speed() == Approx(15.0f));
	}

	SECTION("direction") {
		constant_direction fixed(vector2(3, 4));
		REQUIRE(fixed.get_direction().x == Approx(0.6f));
		REQUIRE(fixed.get_direction().y == Approx(0.8f));
		REQUIRE(throws_code(errc::zero_length_vector, [] { constant_direction{vector2()}; }));

		any_direction any(make_ref<mt_random_source>(5u));
		for (int i = 0; i < 100; ++i)
			REQUIRE(any.get_direction().magnitude() == Approx(1.0f));

		auto rnd = make_ref<scripted_random_source>(std::vector<float>{1.0f});
		spread_direction spread(0.0f, pi / 2.0f, rnd);
		auto d = spread.get_direction();
		REQUIRE(d.x == Approx(0.0f).margin(1e-6));
		REQUIRE(d.y == Approx(1.0f));

		REQUIRE(throws_code(errc::invalid_argument, [] { spread_direction{0.0f, -0.1f}; }));
	}

	SECTION("lifetime") {
		constant_lifetime fixed(2.0f);
		REQUIRE(fixed.get_lifetime() == 2.0f);

		random_lifetime exact(1.0f, 1.0f);
		REQUIRE(exact.get_lifetime() == 1.0f);

		REQUIRE(throws_code(errc::invalid_argument, [] { constant_lifetime{0.0f}; }));
		REQUIRE(throws_code(errc::invalid_argument, [] { random_lifetime{1.0f, 0.5f}; }));
	}

	SECTION("color") {
		const color red(255, 0, 0);
		const color blue(0, 0, 255);

		constant_color fixed(red);
		REQUIRE(fixed.get_color() == red);

		auto rnd = make_ref<scripted_random_source>(std::vector<float>{0.0f}, std::vector<size_t>{1, 0});
		color_choice choice({red, blue}, rnd);
		REQUIRE(choice.get_color() == blue);
		REQUIRE(choice.get_color() == red);

		REQUIRE(throws_code(errc::empty_choice, [] { color_choice{std::vector<color>()}; }));
	}
}

TEST_CASE("fields", "[particles]") {
	const vector2 velocity{10.0f, -4.0f};

	SECTION("constant") {
		constant_field gravity(vector2(0.0f, 9.8f));
		REQUIRE(gravity.get_accel(vector2(100, 100), velocity) == vector2(0.0f, 9.8f));
	}

	SECTION("drag opposes velocity") {
		drag_field drag(0.5f);
		REQUIRE(drag.get_accel(vector2(), velocity) == vector2(-5.0f, 2.0f));

		drag_field none(0.0f);
		REQUIRE(none.get_accel(vector2(), velocity).magnitude() == 0.0f);
	}

	SECTION("point attraction") {
		point_attract_field attract(vector2(10, 0), 4.0f);
		REQUIRE(attract.get_accel(vector2(0, 0), velocity) == vector2(4.0f, 0.0f));
		REQUIRE(attract.get_accel(vector2(10, 0), velocity) == vector2());

		point_attract_field repulse(vector2(10, 0), -4.0f);
		REQUIRE(repulse.get_accel(vector2(0, 0), velocity) == vector2(-4.0f, 0.0f));
	}

	SECTION("point attraction with falloff") {
		point_attract_field attract(vector2(0, 0), 4.0f, 10.0f);
		auto half_way = attract.get_accel(vector2(0, 5), velocity);
		REQUIRE(half_way.x == Approx(0.0f).margin(1e-6));
		REQUIRE(half_way.y == Approx(-2.0f));

		REQUIRE(attract.get_accel(vector2(0, 10), velocity) == vector2());
		REQUIRE(attract.get_accel(vector2(30, 0), velocity) == vector2());
		REQUIRE(attract.get_accel(vector2(0, 0), velocity) == vector2());

		REQUIRE(throws_code(errc::invalid_argument, [] { point_attract_field{vector2(), 1.0f, 0.0f}; }));
	}

	SECTION("turbulence") {
		auto calm = make_ref<scripted_random_source>(std::vector<float>{0.9f});
		turbulence_field still(0.5f, 3.0f, calm);
		REQUIRE(still.get_accel(vector2(), velocity) == vector2());

		auto gusty = make_ref<scripted_random_source>(std::vector<float>{0.1f, 0.0f});
		turbulence_field kick(0.5f, 3.0f, gusty);
		auto a = kick.get_accel(vector2(), velocity);
		REQUIRE(a.x == Approx(3.0f));
		REQUIRE(a.y == Approx(0.0f).margin(1e-6));

		REQUIRE(throws_code(errc::invalid_argument, [] { turbulence_field{1.5f, 1.0f}; }));
	}
}

TEST_CASE("particle", "[particles]") {
	recording_surface s;
	const color c(1, 2, 3);

	SECTION("moves and ages") {
		particle p(vector2(0, 0), vector2(2, -4), 1.0f, c, 0);
		p.step(0.25f);
		REQUIRE(p.position() == vector2(0.5f, -1.0f));
		REQUIRE(p.lifetime_remaining() == Approx(0.75f));
		REQUIRE_FALSE(p.can_reap());

		p.step(1.0f);
		REQUIRE(p.lifetime_remaining() == 0.0f);
		REQUIRE(p.can_reap());
	}

	SECTION("size picks the primitive") {
		particle pixel(vector2(1.5f, 2.5f), vector2(), 1.0f, c, 0);
		particle blob(vector2(3, 4), vector2(), 1.0f, c, 6);

		pixel.draw(s);
		blob.draw(s);

		REQUIRE(s._points == std::vector<point>{point(1, 2)});
		REQUIRE(s._circles == std::vector<point>{point(3, 4)});
		REQUIRE(s._radii.front() == 6);
		REQUIRE(s._colors.front() == c);
	}

	SECTION("invalid attributes") {
		REQUIRE(throws_code(errc::invalid_argument, [&] { particle{vector2(), vector2(), 1.0f, c, -1}; }));
		REQUIRE(throws_code(errc::invalid_argument, [&] { particle{vector2(), vector2(), 0.0f, c, 1}; }));
	}

	SECTION("reap kills at once") {
		particle p(vector2(), vector2(), 5.0f, c, 0);
		p.reap();
		REQUIRE(p.can_reap());
	}
}

TEST_CASE("particle reaped while in a list", "[particles]") {
	recording_surface s;
	actor_list<particle> particles;
	auto a = particles.append(make_ref<particle>(vector2(), vector2(1, 0), 5.0f, color(), 0));
	auto b = particles.append(make_ref<particle>(vector2(), vector2(1, 0), 5.0f, color(), 0));

	particles.step(1.0f);
	a->reap();

	particles.step(1.0f);
	REQUIRE(particles.size() == 1);
	REQUIRE(a->position() == vector2(1, 0));
	REQUIRE(b->position() == vector2(2, 0));

	particles.draw(s);
	REQUIRE(s._points.size() == 2);
}

#include <catch2/catch.hpp>
#include <ember/particles.hpp>

#include "helpers.hpp"

#include <memory>
#include <vector>

using namespace ember;
using namespace ember::test;

namespace {

// Emits from the origin to the right at 10 units per second
ref_ptr<emitter> make_straight_emitter(std::unique_ptr<emitter_rate> rate, float lifetime = 1.0f,
	int start_size = 0, std::unique_ptr<emitter_field> field = nullptr)
{
	return make_ref<emitter>(vector2(0, 0),
		std::move(rate),
		std::make_unique<constant_speed>(10.0f),
		std::make_unique<constant_direction>(vector2(1, 0)),
		std::make_unique<constant_lifetime>(lifetime),
		std::make_unique<constant_color>(color(255, 128, 0)),
		start_size,
		std::move(field));
}

std::vector<vector2> positions(const emitter& e) {
	std::vector<vector2> result;
	e.particles().for_each([&](const particle& p) { result.push_back(p.position()); });
	return result;
}

} // namespace

TEST_CASE("emitter burst end to end", "[emitter]") {
	recording_surface s;

	auto e = make_ref<emitter>(vector2(100, 100),
		std::make_unique<burst_rate>(3),
		std::make_unique<random_speed>(10.0f, 20.0f),
		std::make_unique<any_direction>(),
		std::make_unique<random_lifetime>(1.0f, 1.0f),
		std::make_unique<constant_color>(color(255, 255, 0)),
		0,
		std::make_unique<constant_field>(vector2()));

	e->step(0.016f);
	REQUIRE(e->particles().size() == 3);
	REQUIRE(e->rate().is_complete());
	REQUIRE_FALSE(e->can_reap());

	e->step(1.0f);
	REQUIRE(e->particles().empty());
	REQUIRE(e->can_reap());

	// Particles that died in the last step are drawn one final time
	e->draw(s);
	REQUIRE(s._points.size() == 3);
	REQUIRE(s._colors.front() == color(255, 255, 0));

	REQUIRE(throws_code(errc::invalid_state, [&] { e->step(0.016f); }));
}

TEST_CASE("emitter field integration", "[emitter]") {
	auto e = make_straight_emitter(std::make_unique<burst_rate>(1), 10.0f, 0,
		std::make_unique<constant_field>(vector2(0.0f, -2.0f)));

	e->step(0.5f);

	e->particles().for_each([](const particle& p) {
		// Velocity is updated first and then used to move
		REQUIRE(p.velocity().x == Approx(10.0f));
		REQUIRE(p.velocity().y == Approx(-1.0f));
		REQUIRE(p.position().x == Approx(5.0f));
		REQUIRE(p.position().y == Approx(-0.5f));
	});
	REQUIRE(e->particles().size() == 1);
}

TEST_CASE("emitter drag slows particles", "[emitter]") {
	auto e = make_straight_emitter(std::make_unique<burst_rate>(1), 10.0f, 0,
		std::make_unique<drag_field>(0.5f));

	e->step(0.1f);
	e->step(0.1f);

	e->particles().for_each([](const particle& p) {
		REQUIRE(p.velocity().x < 10.0f);
		REQUIRE(p.velocity().x > 0.0f);
		REQUIRE(p.velocity().y == 0.0f);
	});
}

TEST_CASE("emitter start and stop", "[emitter]") {
	auto e = make_straight_emitter(std::make_unique<constant_delay_rate>(0.25f), 10.0f);
	REQUIRE(e->emitting());

	e->stop();
	REQUIRE_FALSE(e->emitting());
	e->step(1.0f);
	REQUIRE(e->particles().empty());
	REQUIRE_FALSE(e->can_reap());

	e->start();
	e->step(0.5f);
	REQUIRE(e->particles().size() == 2);

	// Stopping keeps the particles that are already out
	e->stop();
	e->step(0.5f);
	REQUIRE(e->particles().size() == 2);
}

TEST_CASE("emitter lifecycle", "[emitter]") {
	SECTION("waits for its particles") {
		auto e = make_straight_emitter(std::make_unique<burst_rate>(2), 1.0f);

		e->step(0.5f);
		REQUIRE(e->particles().size() == 2);
		REQUIRE_FALSE(e->can_reap());

		e->step(0.5f);
		REQUIRE(e->can_reap());
	}

	SECTION("never done while the rate runs") {
		auto e = make_straight_emitter(std::make_unique<constant_delay_rate>(100.0f), 0.5f);
		for (int i = 0; i < 10; ++i)
			e->step(1.0f);
		REQUIRE(e->particles().empty());
		REQUIRE_FALSE(e->can_reap());
	}

	SECTION("reap kills everything") {
		auto e = make_straight_emitter(std::make_unique<constant_delay_rate>(0.25f), 10.0f);
		e->step(1.0f);
		REQUIRE(e->particles().size() == 4);

		e->reap();
		REQUIRE(e->particles().empty());
		REQUIRE_FALSE(e->emitting());
		REQUIRE(e->can_reap());
	}

	SECTION("timed rate runs out") {
		auto e = make_ref<emitter>(vector2(0, 0),
			std::make_unique<timed_random_delay_rate>(0.1f, 0.1f, 0.5f),
			std::make_unique<constant_speed>(1.0f),
			std::make_unique<any_direction>(),
			std::make_unique<constant_lifetime>(1.0f),
			std::make_unique<constant_color>(color()),
			0);

		e->step(0.25f);
		REQUIRE(e->particles().size() >= 1);
		REQUIRE_FALSE(e->rate().is_complete());

		e->step(0.25f);
		REQUIRE(e->rate().is_complete());

		const size_t emitted = e->particles().size();
		e->step(0.1f);
		REQUIRE(e->particles().size() == emitted);

		e->step(1.0f);
		REQUIRE(e->can_reap());
	}
}

TEST_CASE("emitter position", "[emitter]") {
	auto e = make_straight_emitter(std::make_unique<constant_delay_rate>(0.5f), 10.0f);

	e->step(0.5f);
	e->position(vector2(100, 0));
	REQUIRE(e->position() == vector2(100, 0));
	e->step(0.5f);

	// The first particle keeps flying from the old origin
	auto where = positions(*e);
	REQUIRE(where.size() == 2);
	REQUIRE(where[0].x == Approx(10.0f));
	REQUIRE(where[1].x == Approx(105.0f));
}

TEST_CASE("emitter drawing", "[emitter]") {
	recording_surface s;
	auto e = make_straight_emitter(std::make_unique<burst_rate>(2), 1.0f, 4);

	e->step(0.1f);
	e->draw(s);

	REQUIRE(s._circles.size() == 2);
	REQUIRE(s._radii == (std::vector<int>{4, 4}));
	REQUIRE(s._points.empty());
	REQUIRE(s._circles.front() == point(1, 0));
}

TEST_CASE("emitter construction", "[emitter]") {
	SECTION("every policy but the field is required") {
		REQUIRE(throws_code(errc::invalid_argument, [] {
			emitter e(vector2(),
				std::make_unique<burst_rate>(1),
				nullptr,
				std::make_unique<any_direction>(),
				std::make_unique<constant_lifetime>(1.0f),
				std::make_unique<constant_color>(color()),
				0);
		}));
	}

	SECTION("negative size") {
		REQUIRE(throws_code(errc::invalid_argument, [] {
			make_straight_emitter(std::make_unique<burst_rate>(1), 1.0f, -1);
		}));
	}
}

TEST_CASE("emitters in a list", "[emitter]") {
	actor_list<emitter> emitters;
	emitters.append(make_straight_emitter(std::make_unique<burst_rate>(5), 0.5f));
	emitters.append(make_straight_emitter(std::make_unique<burst_rate>(5), 1.5f));

	emitters.step(0.5f);
	REQUIRE(emitters.size() == 1);

	emitters.step(0.5f);
	REQUIRE(emitters.size() == 1);

	emitters.step(0.5f);
	REQUIRE(emitters.empty());

	size_t live = 0;
	emitters.for_each([&](emitter&) { ++live; });
	REQUIRE(live == 0);
}

TEST_CASE("emitter reaped while in a list", "[emitter]") {
	recording_surface s;
	actor_list<emitter> emitters;
	auto e = emitters.append(make_straight_emitter(std::make_unique<constant_delay_rate>(0.25f), 10.0f));

	emitters.step(0.5f);
	REQUIRE(e->particles().size() == 2);

	e->reap();
	REQUIRE_NOTHROW(emitters.step(0.1f));
	REQUIRE(emitters.empty());

	// Still drawn once, with nothing left to show
	emitters.draw(s);
	REQUIRE(s.primitives() == 0);

	emitters.step(0.1f);
	REQUIRE(emitters.empty());
}

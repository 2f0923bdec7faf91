#include <catch2/catch.hpp>
#include <ember/timers.hpp>

#include <string>
#include <vector>

using namespace ember;

TEST_CASE("timer manager", "[timers]") {
	timer_manager timers;
	std::vector<std::string> fired;

	SECTION("fires once the delay has passed") {
		timers.add(1.0f, [&] { fired.push_back("a"); });
		REQUIRE(timers.pending() == 1);

		timers.step(0.5f);
		REQUIRE(fired.empty());

		timers.step(0.6f);
		REQUIRE(fired == std::vector<std::string>{"a"});
		REQUIRE(timers.empty());

		timers.step(5.0f);
		REQUIRE(fired.size() == 1);
	}

	SECTION("ties fire in registration order") {
		timers.add(0.5f, [&] { fired.push_back("first"); });
		timers.add(0.2f, [&] { fired.push_back("early"); });
		timers.add(0.5f, [&] { fired.push_back("second"); });
		timers.add(3.0f, [&] { fired.push_back("late"); });

		timers.step(1.0f);
		REQUIRE(fired == (std::vector<std::string>{"first", "early", "second"}));
		REQUIRE(timers.pending() == 1);
	}

	SECTION("callbacks may add timers") {
		timers.add(0.1f, [&] {
			fired.push_back("outer");
			timers.add(0.1f, [&] { fired.push_back("inner"); });
		});

		timers.step(0.2f);
		REQUIRE(fired == std::vector<std::string>{"outer"});
		REQUIRE(timers.pending() == 1);

		timers.step(0.2f);
		REQUIRE(fired == (std::vector<std::string>{"outer", "inner"}));
	}

	SECTION("delay is measured from the time of adding") {
		timers.step(10.0f);
		timers.add(1.0f, [&] { fired.push_back("a"); });
		timers.step(0.5f);
		REQUIRE(fired.empty());
		timers.step(0.6f);
		REQUIRE(fired.size() == 1);
		REQUIRE(timers.elapsed() == Approx(11.1f));
	}
}

TEST_CASE("frame timer", "[timers]") {
	frame_timer timer;
	REQUIRE(timer.total_ticks() == 0);

	const float dt = timer.tick();
	REQUIRE(dt >= 0.0f);
	REQUIRE(timer.total_ticks() == 1);
	REQUIRE(timer.total_time() >= 0.0f);

	stopwatch watch;
	REQUIRE(watch.elapsed() >= 0.0f);
}

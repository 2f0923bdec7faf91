#include <catch2/catch.hpp>
#include <ember/random.hpp>

#include "helpers.hpp"

#include <string>
#include <vector>

using namespace ember;

TEST_CASE("random source", "[random]") {
	SECTION("seeded sources repeat") {
		mt_random_source a(42);
		mt_random_source b(42);
		for (int i = 0; i < 100; ++i)
			REQUIRE(a.uniform01() == b.uniform01());

		a.seed(7);
		b.seed(7);
		REQUIRE(a.choose_index(1000) == b.choose_index(1000));
	}

	SECTION("uniform stays in bounds") {
		mt_random_source rnd;
		for (int i = 0; i < 1000; ++i) {
			const float u = rnd.uniform01();
			REQUIRE(u >= 0.0f);
			REQUIRE(u < 1.0f);

			const float v = rnd.uniform(-5.0f, 5.0f);
			REQUIRE(v >= -5.0f);
			REQUIRE(v <= 5.0f);

			REQUIRE(rnd.choose_index(3) < 3);
		}
	}

	SECTION("choosing from nothing") {
		mt_random_source rnd;
		REQUIRE_THROWS_AS(rnd.choose_index(0), std::system_error);

		std::vector<int> empty;
		REQUIRE_THROWS_AS(random_choice(rnd, empty), std::system_error);
	}

	SECTION("default source is shared") {
		REQUIRE(random_source::default_source() == random_source::default_source());
	}
}

TEST_CASE("random vectors", "[random]") {
	mt_random_source rnd(1234);

	SECTION("centered vector") {
		for (int i = 0; i < 500; ++i) {
			auto v = random_vector(rnd, 10.0f, 4.0f);
			REQUIRE(std::abs(v.x) <= 5.0f);
			REQUIRE(std::abs(v.y) <= 2.0f);
		}
	}

	SECTION("vector within bounds") {
		for (int i = 0; i < 500; ++i) {
			auto v = random_vector(rnd, 1.0f, 2.0f, -3.0f, -2.0f);
			REQUIRE(v.x >= 1.0f);
			REQUIRE(v.x <= 2.0f);
			REQUIRE(v.y >= -3.0f);
			REQUIRE(v.y <= -2.0f);
		}
	}

	SECTION("in rect") {
		rectf r{10.0f, 20.0f, 5.0f, 5.0f};
		for (int i = 0; i < 500; ++i) {
			auto v = random_in_rect(rnd, r);
			REQUIRE(v.x >= r.left());
			REQUIRE(v.x <= r.right());
			REQUIRE(v.y >= r.top());
			REQUIRE(v.y <= r.bottom());
		}
	}

	SECTION("in circle") {
		for (int i = 0; i < 500; ++i) {
			auto v = random_in_circle(rnd, {100.0f, 100.0f}, 10.0f);
			REQUIRE((v - vector2(100.0f, 100.0f)).magnitude() <= Approx(10.0f));
		}
	}

	SECTION("directions are unit vectors") {
		for (int i = 0; i < 500; ++i)
			REQUIRE(random_direction(rnd).magnitude() == Approx(1.0f));
	}

	SECTION("spread stays within the cone") {
		const vector2 base{0.0f, 1.0f};
		for (int i = 0; i < 500; ++i) {
			auto d = random_direction_with_spread(rnd, pi / 2.0f, 0.1f);
			REQUIRE(d.magnitude() == Approx(1.0f));
			REQUIRE(d.angle_between(base) <= 0.1f + 1e-4f);
		}
	}
}

TEST_CASE("circle sampling takes the radius uniformly", "[random]") {
	// Half of the unit draw gives half the radius, not the area-uniform sqrt(0.5)
	test::scripted_random_source rnd({0.0f, 0.5f});
	auto v = random_in_circle(rnd, {0.0f, 0.0f}, 10.0f);
	REQUIRE(v.x == Approx(5.0f));
	REQUIRE(v.y == Approx(0.0f).margin(1e-6));
}

TEST_CASE("random color", "[random]") {
	test::scripted_random_source rnd({0.0f}, {10, 200, 255});
	REQUIRE(random_color(rnd) == color(10, 200, 255, 255));
}

TEST_CASE("item pickers", "[random]") {
	SECTION("no repeat never gives the same item twice in a row") {
		no_repeat_picker<int> picker({1, 2, 3}, make_ref<mt_random_source>(3));
		int last = picker.next();
		for (int i = 0; i < 200; ++i) {
			const int item = picker.next();
			REQUIRE(item != last);
			last = item;
		}
	}

	SECTION("no repeat picks among the other items") {
		// Second pick chooses index 1 of the remaining {1, 3}
		no_repeat_picker<int> picker({1, 2, 3}, make_ref<test::scripted_random_source>(std::vector<float>{0.0f}, std::vector<size_t>{1, 1}));
		REQUIRE(picker.next() == 2);
		REQUIRE(picker.next() == 3);
	}

	SECTION("no repeat with a single item repeats it") {
		no_repeat_picker<int> picker({7});
		REQUIRE(picker.next() == 7);
		REQUIRE(picker.next() == 7);
	}

	SECTION("cycling starts over") {
		cycling_picker<std::string> picker({"a", "b"});
		REQUIRE(picker.next() == "a");
		REQUIRE(picker.next() == "b");
		REQUIRE(picker.next() == "a");
	}

	SECTION("empty sets are rejected") {
		REQUIRE(test::throws_code(errc::empty_choice, [] { no_repeat_picker<int>{std::vector<int>()}; }));
		REQUIRE(test::throws_code(errc::empty_choice, [] { cycling_picker<int>{std::vector<int>()}; }));
	}
}

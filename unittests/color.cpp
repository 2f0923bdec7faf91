#include <catch2/catch.hpp>
#include <ember/color.hpp>

#include <sstream>

using namespace ember;

TEST_CASE("color", "[color]") {
	SECTION("defaults to opaque white") {
		color c;
		REQUIRE(c == color(255, 255, 255, 255));
	}

	SECTION("checked construction") {
		REQUIRE(color::from_components(1, 2, 3) == color(1, 2, 3));
		REQUIRE_THROWS_AS(color::from_components(256, 0, 0), std::system_error);
		REQUIRE_THROWS_AS(color::from_components(0, -1, 0), std::system_error);
		REQUIRE_THROWS_AS(color::from_components(0, 0, 0, 300), std::system_error);
	}

	SECTION("alpha") {
		const color c(10, 20, 30);
		auto faded = c.with_alpha(128);
		REQUIRE(faded.alpha() == 128);
		REQUIRE(faded.red() == 10);
		REQUIRE(c.alpha() == 255);
		REQUIRE(faded != c);
	}

	SECTION("output") {
		std::ostringstream ss;
		ss << color(1, 2, 3, 4);
		REQUIRE(ss.str() == "rgba(1, 2, 3, 4)");
	}
}

TEST_CASE("color table", "[color]") {
	SECTION("standard names") {
		auto&& table = color_table::standard();
		REQUIRE(table.find("red") == color(255, 0, 0));
		REQUIRE(table.find("gold") == color(255, 215, 0));
		REQUIRE(table.find(color_name("navyblue")) == color(0, 0, 128));
		REQUIRE(table.contains(color_name("white")));
		REQUIRE(&table == &color_table::standard());
	}

	SECTION("missing names") {
		auto&& table = color_table::standard();
		REQUIRE_FALSE(table.contains(color_name("octarine")));

		try {
			table.find("octarine");
			FAIL("lookup of an unknown color must throw");
		} catch (const std::system_error& e) {
			REQUIRE(e.code() == errc::resource_not_found);
		}
	}

	SECTION("custom table") {
		color_table table{
			{"fire", {255, 80, 0}},
			{"smoke", {90, 90, 90, 128}},
		};
		REQUIRE(table.size() == 2);
		REQUIRE(table.find("smoke").alpha() == 128);
	}
}

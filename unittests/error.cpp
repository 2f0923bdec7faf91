#include <catch2/catch.hpp>
#include <ember/error.hpp>

using namespace ember;

TEST_CASE("error codes", "[error]") {
	SECTION("category") {
		std::error_code ec = errc::empty_choice;
		REQUIRE(ec.category() == ember_category());
		REQUIRE(std::string(ec.category().name()) == "ember");
		REQUIRE(ec.message() == "nothing to choose from");
		REQUIRE(ec == errc::empty_choice);
		REQUIRE(ec != errc::invalid_color);
	}

	SECTION("thrown errors carry code and message") {
		try {
			throw_error(errc::zero_length_vector, "vector (0, 0)");
			FAIL("throw_error must not return");
		} catch (const std::system_error& e) {
			REQUIRE(e.code() == errc::zero_length_vector);
			REQUIRE(std::string(e.what()).find("vector (0, 0)") != std::string::npos);
		}
	}
}

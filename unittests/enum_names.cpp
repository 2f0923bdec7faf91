#include <catch2/catch.hpp>
#include <ember/utility/enum_names.hpp>

#include <sstream>

namespace sample {

EM_DEFINE_ENUM(
	blend_mode, uint32_t,
	opaque,
	additive = 42,
	multiply
)

} // namespace sample

TEST_CASE("enum names", "[enum]") {
	using sample::blend_mode;

	SECTION("items") {
		REQUIRE(enum_size(blend_mode()) == 3);

		auto items = enum_items(blend_mode());

		REQUIRE(items[0].name() == "opaque");
		REQUIRE(items[1].name() == "additive");
		REQUIRE(items[2].name() == "multiply");

		REQUIRE(items[0].value() == static_cast<size_t>(blend_mode::opaque));
		REQUIRE(items[1].value() == static_cast<size_t>(blend_mode::additive));
		REQUIRE(items[2].value() == static_cast<size_t>(blend_mode::multiply));
		REQUIRE(items[2].value() == 43);
		REQUIRE(items[3]._name == nullptr);
	}

	SECTION("to string") {
		std::ostringstream oss;
		oss << blend_mode::multiply;
		REQUIRE(oss.str() == "multiply");

		REQUIRE(ember::to_string(blend_mode::additive) == "additive");
	}
}

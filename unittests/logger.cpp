#include <catch2/catch.hpp>
#include <ember/logger.hpp>
#include <ember/error.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace ember;

namespace {

class capture_sink : public logger_sink {
public:
	void write(priority level, const std::string& msg) override {
		_levels.push_back(level);
		_messages.push_back(msg);
	}

	std::vector<priority> _levels;
	std::vector<std::string> _messages;
};

// Installs a sink for the lifetime of a test and removes it afterwards
class scoped_sink {
public:
	explicit scoped_sink(logger_sink* sink) : _sink(sink) { logger::add_sink(_sink.get()); }
	~scoped_sink() { logger::remove_sink(_sink.get()); }

private:
	logger_sink_ptr _sink;
};

} // namespace

TEST_CASE("logger", "[logger]") {
	auto sink = new capture_sink();
	scoped_sink guard(sink);

	SECTION("messages reach the sink") {
		EM_LOGI("emitted " << 3 << " particles");
		EM_LOGW("low on " << "sparks");

		REQUIRE(sink->_messages.size() == 2);
		REQUIRE(sink->_messages[0] == "emitted 3 particles\n");
		REQUIRE(sink->_levels[0] == priority::info);
		REQUIRE(sink->_levels[1] == priority::warn);
	}

	SECTION("errors are logged before they are thrown") {
		REQUIRE_THROWS_AS(throw_error(errc::invalid_state, "bad state"), std::system_error);
		REQUIRE(sink->_levels.back() == priority::error);
		REQUIRE(sink->_messages.back().find("bad state") != std::string::npos);
	}

	SECTION("priority names") {
		std::ostringstream ss;
		ss << priority::warn;
		REQUIRE(ss.str() == "warn");
	}
}

TEST_CASE("stream sink", "[logger]") {
	std::ostringstream out;
	scoped_sink guard(logger_sink::create_stream_sink(out));

	EM_LOGE("out of " << "fuel");

	const std::string line = out.str();
	REQUIRE(line.compare(0, 3, "[!]") == 0);
	REQUIRE(line.find("out of fuel\n") != std::string::npos);
}

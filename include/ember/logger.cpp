#include <ember/logger.hpp>

#include <boost/thread/mutex.hpp>

#include <algorithm>
#include <ctime>
#include <iostream>
#include <ostream>
#include <vector>

namespace ember {

namespace {

using sinks_type = std::vector<logger_sink_ptr>;

sinks_type& sinks() {
	static sinks_type instance;
	return instance;
}

boost::mutex& sinks_mutex() {
	static boost::mutex instance;
	return instance;
}

const char* priority_tag(priority level) noexcept {
	switch (level) {
	case priority::debug:
		return "[D]";
	case priority::info:
		return "[i]";
	case priority::warn:
		return "[*]";
	case priority::error:
		return "[!]";
	}
	return "   ";
}

/// stream sink
class stream_logger_sink : public logger_sink {
public:
	explicit stream_logger_sink(std::ostream& stream)
		: _stream(stream)
	{
	}

	void write(priority level, const std::string& msg) override {
		char buffer[32];
		std::time_t time = std::time(nullptr);
		std::strftime(buffer, sizeof(buffer), "[%X] ", std::localtime(&time));

		_stream << priority_tag(level) << buffer << msg;
		_stream.flush();
	}

private:
	std::ostream& _stream;
};

} // namespace

logger::logger(priority level)
	: _level(level)
{
}

logger::~logger() {
	try {
		_stream << '\n';
		const std::string msg = _stream.str();

		boost::mutex::scoped_lock lock(sinks_mutex());
		for (auto&& sink : sinks())
			sink->write(_level, msg);
	} catch (const std::exception& e) {
		// don't let an exception come out from destructor
		std::cerr << "ember: log sink failed: " << e.what() << std::endl;
	}
}

void logger::add_sink(logger_sink* sink) {
	BOOST_ASSERT(sink);
	boost::mutex::scoped_lock lock(sinks_mutex());
	sinks().push_back(sink);
}

void logger::remove_sink(logger_sink* sink) {
	boost::mutex::scoped_lock lock(sinks_mutex());
	auto&& all = sinks();
	all.erase(std::remove(all.begin(), all.end(), logger_sink_ptr(sink)), all.end());
}

void logger::clear_sinks() {
	boost::mutex::scoped_lock lock(sinks_mutex());
	sinks().clear();
}

logger_sink* logger_sink::create_stream_sink(std::ostream& stream) {
	return new stream_logger_sink(stream);
}

} // namespace ember

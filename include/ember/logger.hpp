#ifndef EMBER_LOGGER_HPP_INCLUDED
#define EMBER_LOGGER_HPP_INCLUDED

#pragma once

// Classes in this file:
//     logger
//     logger_sink

#include <ember/utility/enum_names.hpp>
#include <ember/utility/intrusive.hpp>

#include <sstream>
#include <string>

#define EMBER_LOGGING_LEVEL_NONE 0
#define EMBER_LOGGING_LEVEL_ERROR 1
#define EMBER_LOGGING_LEVEL_WARN 2
#define EMBER_LOGGING_LEVEL_INFO 3
#define EMBER_LOGGING_LEVEL_DEBUG 4

#ifndef EMBER_LOGGING_LEVEL
#if defined(_DEBUG) || !defined(NDEBUG)
#define EMBER_LOGGING_LEVEL EMBER_LOGGING_LEVEL_DEBUG
#else
#define EMBER_LOGGING_LEVEL EMBER_LOGGING_LEVEL_INFO
#endif
#endif // EMBER_LOGGING_LEVEL

#define EM_LOGD(msg) if (EMBER_LOGGING_LEVEL >= EMBER_LOGGING_LEVEL_DEBUG) ::ember::logger(::ember::priority::debug) << msg
#define EM_LOGI(msg) if (EMBER_LOGGING_LEVEL >= EMBER_LOGGING_LEVEL_INFO) ::ember::logger(::ember::priority::info) << msg
#define EM_LOGW(msg) if (EMBER_LOGGING_LEVEL >= EMBER_LOGGING_LEVEL_WARN) ::ember::logger(::ember::priority::warn) << msg
#define EM_LOGE(msg) if (EMBER_LOGGING_LEVEL >= EMBER_LOGGING_LEVEL_ERROR) ::ember::logger(::ember::priority::error) << msg

namespace ember {

EM_DEFINE_ENUM(
	priority, uint32_t,
	debug,
	info,
	warn,
	error
)

class logger_sink;

/// Collects one message and hands it to every installed sink on destruction
class logger {
public:
	explicit logger(priority level);
	~logger();

	logger(const logger&) = delete;
	logger& operator=(const logger&) = delete;

	template <typename T>
	std::ostringstream& operator<<(const T& t) {
		_stream << t;
		return _stream;
	}

	static void add_sink(logger_sink* sink);
	static void remove_sink(logger_sink* sink);
	static void clear_sinks();

private:
	std::ostringstream _stream;
	priority _level;
};

/// Logger sink
class logger_sink : public ref_counter<logger_sink> {
public:
	virtual ~logger_sink() = default;
	virtual void write(priority level, const std::string& msg) = 0;

	/// Sink writing `[tag][time] message` lines; the stream must outlive the sink
	static logger_sink* create_stream_sink(std::ostream& stream);
};

using logger_sink_ptr = ref_ptr<logger_sink>;

} // namespace ember

#endif // EMBER_LOGGER_HPP_INCLUDED

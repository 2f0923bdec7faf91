#include <ember/logger.hpp>

#include <cstdlib>

#ifdef BOOST_ENABLE_ASSERT_HANDLER

// Failed internal invariants are logged before terminating so the diagnostic
// reaches every installed sink
namespace boost {

void assertion_failed(char const* expr, char const* function, char const* file, long line) {
	EM_LOGE(file << '(' << line << "): assertion `" << expr << "` failed in " << function);
	std::abort();
}

void assertion_failed_msg(char const* expr, char const* msg, char const* function, char const* file, long line) {
	EM_LOGE(file << '(' << line << "): assertion `" << expr << "` failed in " << function << ": " << msg);
	std::abort();
}

} // namespace boost

#endif // BOOST_ENABLE_ASSERT_HANDLER

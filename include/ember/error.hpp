#ifndef EMBER_ERROR_HPP_INCLUDED
#define EMBER_ERROR_HPP_INCLUDED

#pragma once

// Functions in this file:
//     ember_category
//     make_error_code
//     make_error_condition
//     throw_error

#include <ember/logger.hpp>

#include <boost/throw_exception.hpp>

#include <system_error>
#include <string>
#include <cstdio>

namespace ember {

enum class errc {
	success,
	uninitialized_range,
	zero_length_vector,
	empty_choice,
	invalid_color,
	invalid_argument,
	division_by_zero,
	invalid_state,
	resource_not_found
};

namespace detail {

class ember_error_category : public std::error_category {
public:
	virtual const char* name() const noexcept override { return "ember"; }

	virtual std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
		case errc::success:
			return "operation succeeded";
		case errc::uninitialized_range:
			return "range is not initialized";
		case errc::zero_length_vector:
			return "vector has zero length";
		case errc::empty_choice:
			return "nothing to choose from";
		case errc::invalid_color:
			return "invalid color component";
		case errc::invalid_argument:
			return "invalid argument";
		case errc::division_by_zero:
			return "division by zero";
		case errc::invalid_state:
			return "operation not allowed in current state";
		case errc::resource_not_found:
			return "resource not found";
		}

		char buffer[32];
		std::snprintf(buffer, sizeof(buffer), "unknown error: 0x%X", ev);
		return buffer;
	}
};

} // namespace detail

inline const std::error_category& ember_category() noexcept {
	static detail::ember_error_category instance;
	return instance;
}

inline std::error_code make_error_code(errc e) noexcept {
	return {static_cast<int>(e), ember_category()};
}

inline std::error_condition make_error_condition(errc e) noexcept {
	return {static_cast<int>(e), ember_category()};
}

/// Throws std::system_error carrying `e`; the message should name the broken
/// invariant and the offending values
[[noreturn]] inline void throw_error(errc e, const std::string& message) {
	EM_LOGE(message << " (" << make_error_code(e).message() << ')');
	BOOST_THROW_EXCEPTION(std::system_error(make_error_code(e), message));
}

} // namespace ember

namespace std {
	template <>
	struct is_error_code_enum<::ember::errc> : true_type {};
}

#endif // EMBER_ERROR_HPP_INCLUDED

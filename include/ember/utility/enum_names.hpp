#ifndef EMBER_UTILITY_ENUM_NAMES_HPP_INCLUDED
#define EMBER_UTILITY_ENUM_NAMES_HPP_INCLUDED

#pragma once

// Classes in this file:
//     enum_item_info
//
// Functions in this file:
//     to_string()
//
// Macros in this file:
//     EM_DEFINE_ENUM

#include <boost/preprocessor/variadic/size.hpp>
#include <boost/assert.hpp>

#include <ostream>
#include <string>
#include <cstddef>
#include <cstdint>

#include <cctype>
#include <cstring>

namespace ember {

struct enum_item_info {
	std::string name() const { return std::string(_name, _length); }
	size_t value() const noexcept { return _value; }

	const char* _name;
	size_t _length;
	size_t _value;
};

namespace detail {

// Evaluates `a, b = 42, c` as a list of counters so item values follow enum rules
template <typename Tag>
struct enum_counter {
	enum_counter(size_t v) noexcept : _value(v) { next = _value + 1; }
	enum_counter() noexcept : _value(next) { next = _value + 1; }

	operator size_t() const noexcept { return _value; }

private:
	size_t _value;

	static size_t next;
};

template <typename Tag> size_t enum_counter<Tag>::next;

struct enum_parser {
	static void parse(const char* str, enum_item_info* infos, const size_t* values) noexcept {
		auto is_identifier = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; };

		size_t i = 0;
		for (const char* b = str; b; ) {
			while (std::isspace(static_cast<unsigned char>(*b)))
				++b;

			const char* name = b;
			while (is_identifier(*b))
				++b;

			infos[i]._name = name;
			infos[i]._length = b - name;
			infos[i]._value = values[i];
			++i;

			if ((b = std::strchr(b, ',')))
				++b;
		}

		infos[i]._name = nullptr;
		infos[i]._length = 0;
		infos[i]._value = 0;
	}

	static std::string to_string(const enum_item_info* info, size_t value) {
		for (auto item = info; item->_name; ++item) {
			if (item->_value == value)
				return item->name();
		}
		BOOST_ASSERT_MSG(false, "Unknown enum value");
		return std::string();
	}
};

} // namespace detail

/// Name of an enum item declared with EM_DEFINE_ENUM
template <typename EnumType>
inline std::string to_string(EnumType value) {
	return detail::enum_parser::to_string(enum_items(value), static_cast<size_t>(value));
}

} // namespace ember

// Defines an enum class in the current namespace together with name lookup
// found by argument-dependent lookup, so it works inside any namespace
#define EM_DEFINE_ENUM(EnumName, UnderlyingType, ...)                                                      \
	enum class EnumName : UnderlyingType {                                                                 \
		__VA_ARGS__                                                                                        \
	};                                                                                                     \
	constexpr size_t enum_size(EnumName) noexcept { return BOOST_PP_VARIADIC_SIZE(__VA_ARGS__); }          \
	inline const ::ember::enum_item_info* enum_items(EnumName) noexcept {                                  \
		static ::ember::enum_item_info __infos[BOOST_PP_VARIADIC_SIZE(__VA_ARGS__) + 1];                   \
		for (static bool __init = false; !__init && (__init = true); ) {                                   \
			::ember::detail::enum_counter<EnumName> __VA_ARGS__;                                           \
			size_t __values[] = { __VA_ARGS__ };                                                           \
			::ember::detail::enum_parser::parse(#__VA_ARGS__, __infos, __values);                          \
		}                                                                                                  \
		return __infos;                                                                                    \
	}                                                                                                      \
	inline std::ostream& operator<<(std::ostream& os, EnumName e) {                                        \
		return os << ::ember::to_string(e);                                                                \
	}

#endif // EMBER_UTILITY_ENUM_NAMES_HPP_INCLUDED

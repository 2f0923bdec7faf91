#ifndef EMBER_UTILITY_INTRUSIVE_HPP_INCLUDED
#define EMBER_UTILITY_INTRUSIVE_HPP_INCLUDED

#pragma once

#include <boost/smart_ptr/intrusive_ref_counter.hpp>
#include <boost/smart_ptr/intrusive_ptr.hpp>

#include <utility>

namespace ember {

// Simulation runs on a single thread, so reference counts need not be atomic
template <typename T>
using ref_counter = boost::intrusive_ref_counter<T, boost::thread_unsafe_counter>;

template <typename T>
using ref_ptr = boost::intrusive_ptr<T>;

template <typename T, typename... Args>
inline ref_ptr<T> make_ref(Args&&... args) {
	return new T(std::forward<Args>(args)...);
}

} // namespace ember

#endif // EMBER_UTILITY_INTRUSIVE_HPP_INCLUDED

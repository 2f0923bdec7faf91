#ifndef EMBER_ACTOR_HPP_INCLUDED
#define EMBER_ACTOR_HPP_INCLUDED

#pragma once

#include <ember/actor_fwd.hpp>

#include <boost/assert.hpp>

#include <algorithm>
#include <utility>

namespace ember {

////////////////////////////////////////////////////////////////////////////////
// actor_list
//

template <typename T>
inline T* actor_list<T>::append(const pointer_type& a) {
	BOOST_ASSERT(a);
	_entries.push_back({a, false});
	return _entries.back().ptr.get();
}

template <typename T>
inline T* actor_list<T>::append(pointer_type&& a) {
	BOOST_ASSERT(a);
	_entries.push_back({std::move(a), false});
	return _entries.back().ptr.get();
}

template <typename T>
inline void actor_list<T>::step(float dt) {
	// Actors that died last frame have been drawn one last time
	release_dying();

	// Stepping may append to this list, so iterate by index over the actors
	// present at the start of the step and hold a reference while stepping.
	// A reap() from inside a step bumps the generation and ends the pass.
	const size_t count = _entries.size();
	const unsigned generation = _generation;

	for (size_t i = 0; i < count && _generation == generation; ++i) {
		pointer_type a = _entries[i].ptr;
		if (!a->can_reap())
			a->step(dt);
	}

	if (_generation != generation)
		return;

	// Second pass marks the reapable ones once every actor has stepped,
	// actors appended during this step wait for their first step
	for (size_t i = 0; i < count; ++i) {
		entry& e = _entries[i];
		if (!e.dying && e.ptr->can_reap()) {
			e.dying = true;
			++_dying;
		}
	}
}

template <typename T>
inline void actor_list<T>::draw(surface& s) {
	const size_t count = _entries.size();
	const unsigned generation = _generation;

	for (size_t i = 0; i < count && _generation == generation; ++i) {
		pointer_type a = _entries[i].ptr;
		a->draw(s);
	}
}

template <typename T>
inline void actor_list<T>::reap() {
	// Work on a detached copy in case reaping touches this list
	auto entries = std::move(_entries);
	_entries.clear();
	_dying = 0;
	++_generation;

	for (auto&& e : entries)
		e.ptr->reap();
}

template <typename T>
template <typename Handler>
inline void actor_list<T>::for_each(Handler handler) {
	for (auto&& e : _entries) {
		if (!e.dying)
			handler(*e.ptr);
	}
}

template <typename T>
template <typename Handler>
inline void actor_list<T>::for_each(Handler handler) const {
	for (auto&& e : _entries) {
		if (!e.dying)
			handler(static_cast<const T&>(*e.ptr));
	}
}

template <typename T>
inline void actor_list<T>::release_dying() noexcept {
	if (!_dying)
		return;

	_entries.erase(std::remove_if(_entries.begin(), _entries.end(),
		[](const entry& e) { return e.dying; }),
		_entries.end()
	);

	_dying = 0;
}

} // namespace ember

#endif // EMBER_ACTOR_HPP_INCLUDED

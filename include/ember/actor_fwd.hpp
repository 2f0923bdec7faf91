#ifndef EMBER_ACTOR_FWD_HPP_INCLUDED
#define EMBER_ACTOR_FWD_HPP_INCLUDED

#pragma once

// Classes in this file:
//     actor
//     actor_list<>

#include <ember/utility/intrusive.hpp>

#include <type_traits>
#include <vector>

namespace ember {

class surface;

///
/// Actor
///
/// Anything the frame driver steps and draws. An actor that reports
/// can_reap() is dropped by the list that owns it.
///
class actor : public ref_counter<actor> {
public:
	actor() noexcept = default;

	actor(const actor&) = delete;
	actor& operator=(const actor&) = delete;

	virtual ~actor() = default;

	/// Advance by `dt` seconds
	virtual void step(float dt) = 0;
	virtual void draw(surface& s) = 0;
	virtual bool can_reap() const = 0;

	/// Cut the lifetime short so the owner drops it on its next step
	/// without stepping it again
	virtual void reap() {}
};

///
/// Ordered list of actors with automatic step/draw/reap
///
/// Actors that become reapable during step() leave the list at once but
/// are still drawn by the following draw(); they are released at the start
/// of the next step(). An actor that is already reapable when its turn comes
/// (one reaped from outside) is not stepped again. Removal from the list does
/// not destroy an actor that is referenced elsewhere.
///
template <typename T = actor>
class actor_list : public actor {
	static_assert(std::is_base_of<actor, T>::value, "T is not derived from actor");

public:
	using value_type = T;
	using pointer_type = ref_ptr<T>;

	actor_list() noexcept = default;

	/// Add to the end; actors appended during step() are first stepped on the next frame
	T* append(const pointer_type& a);
	T* append(pointer_type&& a);

	void step(float dt) override;
	void draw(surface& s) override;

	/// A list never goes away on its own
	bool can_reap() const noexcept override { return false; }

	/// Reap every actor and clear the list, also safe from inside an actor's step()
	void reap() override;

	/// Number of live actors
	size_t size() const noexcept { return _entries.size() - _dying; }
	bool empty() const noexcept { return size() == 0; }

	/// Visit live actors in insertion order
	template <typename Handler> void for_each(Handler handler);
	template <typename Handler> void for_each(Handler handler) const;

private:
	void release_dying() noexcept;

private:
	struct entry {
		pointer_type ptr;
		bool dying;
	};

	std::vector<entry> _entries;
	size_t _dying = 0;
	unsigned _generation = 0;
};

} // namespace ember

#endif // EMBER_ACTOR_FWD_HPP_INCLUDED

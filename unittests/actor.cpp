#include <catch2/catch.hpp>
#include <ember/actor.hpp>

#include "helpers.hpp"

using namespace ember;
using namespace ember::test;

TEST_CASE("actor list", "[actor]") {
	recording_surface s;
	actor_list<counting_actor> list;

	SECTION("insertion order") {
		for (int i = 1; i <= 3; ++i)
			list.append(make_ref<counting_actor>(i * 10));

		int expected = 10;
		list.for_each([&](counting_actor& a) {
			REQUIRE(a._steps_to_live == expected);
			expected += 10;
		});
		REQUIRE(list.size() == 3);
	}

	SECTION("reapable actors are drawn once more") {
		auto a = list.append(make_ref<counting_actor>(1));
		auto b = list.append(make_ref<counting_actor>(3));

		list.step(0.1f);
		REQUIRE(a->can_reap());
		REQUIRE(list.size() == 1);

		list.draw(s);
		REQUIRE(a->_draws == 1);
		REQUIRE(b->_draws == 1);

		list.step(0.1f);
		list.draw(s);
		REQUIRE(b->_steps == 2);
		REQUIRE(b->_draws == 2);
		REQUIRE(list.size() == 1);
	}

	SECTION("removed actor outlives the list entry") {
		auto keep = make_ref<counting_actor>(1);
		list.append(keep);

		list.step(0.1f);
		list.step(0.1f);

		REQUIRE(list.empty());
		REQUIRE(keep->_steps == 1);
		REQUIRE(keep->use_count() == 1);
	}

	SECTION("second pass sees every actor stepped") {
		for (int i = 0; i < 5; ++i)
			list.append(make_ref<counting_actor>(i % 2 ? 1 : 2));

		list.step(0.1f);
		REQUIRE(list.size() == 3);

		list.step(0.1f);
		REQUIRE(list.empty());
	}

	SECTION("reap forces every live actor") {
		auto a = list.append(make_ref<counting_actor>(5));
		auto b = list.append(make_ref<counting_actor>(5));
		ref_ptr<counting_actor> hold_a(a);
		ref_ptr<counting_actor> hold_b(b);

		list.reap();

		REQUIRE(list.empty());
		REQUIRE(hold_a->_reaped);
		REQUIRE(hold_b->_reaped);
	}

	SECTION("reap reaches actors already dying") {
		auto a = list.append(make_ref<counting_actor>(1));
		ref_ptr<counting_actor> hold_a(a);

		list.step(0.1f);
		REQUIRE(list.empty());

		list.reap();
		REQUIRE(hold_a->_reaped);
	}

	SECTION("actor reaped from outside is not stepped again") {
		auto a = list.append(make_ref<counting_actor>(5));
		auto b = list.append(make_ref<counting_actor>(5));

		list.step(0.1f);
		a->_steps_to_live = 0;

		list.step(0.1f);
		REQUIRE(a->_steps == 1);
		REQUIRE(b->_steps == 2);
		REQUIRE(list.size() == 1);

		list.draw(s);
		REQUIRE(a->_draws == 1);
	}

	SECTION("never reapable itself") {
		REQUIRE_FALSE(list.can_reap());
		list.step(0.1f);
		REQUIRE_FALSE(list.can_reap());
	}
}

namespace {

// Appends a child when stepped for the first time
class spawning_actor : public actor {
public:
	explicit spawning_actor(actor_list<>& owner) noexcept : _owner(owner) {}

	void step(float) override {
		if (!_spawned) {
			_spawned = true;
			_child = _owner.append(make_ref<test::counting_actor>(10));
		}
	}

	void draw(surface&) noexcept override {}
	bool can_reap() const noexcept override { return false; }

	actor_list<>& _owner;
	actor* _child = nullptr;
	bool _spawned = false;
};

} // namespace

TEST_CASE("actor list append during step", "[actor]") {
	actor_list<> list;
	auto spawner = static_cast<spawning_actor*>(list.append(make_ref<spawning_actor>(list)));

	list.step(0.1f);
	REQUIRE(list.size() == 2);

	auto child = static_cast<counting_actor*>(spawner->_child);
	REQUIRE(child->_steps == 0);

	list.step(0.1f);
	REQUIRE(child->_steps == 1);
}

namespace {

// Reaps the list that owns it from inside its own step
class clearing_actor : public actor {
public:
	explicit clearing_actor(actor_list<>& owner) noexcept : _owner(owner) {}

	void step(float) override { _owner.reap(); }
	void draw(surface&) noexcept override {}
	bool can_reap() const noexcept override { return false; }

	actor_list<>& _owner;
};

// Appends an actor that is reapable from the start
class stillborn_spawner : public actor {
public:
	explicit stillborn_spawner(actor_list<>& owner) noexcept : _owner(owner) {}

	void step(float) override {
		if (!_child)
			_child = static_cast<test::counting_actor*>(_owner.append(make_ref<test::counting_actor>(0)));
	}

	void draw(surface&) noexcept override {}
	bool can_reap() const noexcept override { return false; }

	actor_list<>& _owner;
	test::counting_actor* _child = nullptr;
};

} // namespace

TEST_CASE("actor list reaped by one of its actors", "[actor]") {
	recording_surface s;
	actor_list<> list;

	list.append(make_ref<clearing_actor>(list));
	auto a = list.append(make_ref<counting_actor>(5));
	auto b = list.append(make_ref<counting_actor>(5));
	ref_ptr<actor> hold_a(a);
	ref_ptr<actor> hold_b(b);

	REQUIRE_NOTHROW(list.step(0.1f));
	REQUIRE(list.empty());

	auto ca = static_cast<counting_actor*>(hold_a.get());
	auto cb = static_cast<counting_actor*>(hold_b.get());
	REQUIRE(ca->_reaped);
	REQUIRE(cb->_reaped);
	REQUIRE(ca->_steps == 0);
	REQUIRE(cb->_steps == 0);

	list.draw(s);
	REQUIRE(ca->_draws == 0);

	// The list is usable again afterwards
	auto c = static_cast<counting_actor*>(list.append(make_ref<counting_actor>(1)));
	list.step(0.1f);
	REQUIRE(c->_steps == 1);
}

TEST_CASE("actor appended reapable during step", "[actor]") {
	recording_surface s;
	actor_list<> list;
	auto spawner = static_cast<stillborn_spawner*>(list.append(make_ref<stillborn_spawner>(list)));

	list.step(0.1f);
	REQUIRE(spawner->_child);
	REQUIRE(list.size() == 2);

	list.draw(s);
	list.step(0.1f);
	REQUIRE(list.size() == 1);
	REQUIRE(spawner->_child->_steps == 0);
}

TEST_CASE("nested actor lists", "[actor]") {
	recording_surface s;
	actor_list<> outer;
	auto inner = static_cast<actor_list<>*>(outer.append(make_ref<actor_list<>>()));
	auto a = static_cast<counting_actor*>(inner->append(make_ref<counting_actor>(2)));

	outer.step(0.1f);
	outer.draw(s);
	REQUIRE(a->_steps == 1);
	REQUIRE(a->_draws == 1);
	REQUIRE(outer.size() == 1);
}

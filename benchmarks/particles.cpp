#include <nonius/nonius.h++>

#include <ember/particles.hpp>
#include <ember/shapes.hpp>

#include <memory>

using namespace ember;

namespace {

class null_surface : public surface {
public:
	void draw_point(const point&, const color&) override {}
	void draw_circle(const point&, int, const color&) override {}
	void draw_line(const point&, const point&, const color&) override {}
	void fill_rect(const rect&, const color&) override {}
	void blit(const image_name&, const point&) override {}
};

ref_ptr<emitter> make_fountain(ref_ptr<random_source> rnd) {
	return make_ref<emitter>(vector2(320, 480),
		std::make_unique<constant_delay_rate>(0.001f),
		std::make_unique<random_speed>(50.0f, 150.0f, rnd),
		std::make_unique<spread_direction>(-pi / 2.0f, 0.3f, rnd),
		std::make_unique<random_lifetime>(1.0f, 2.0f, rnd),
		std::make_unique<color_choice>(std::vector<color>{{255, 0, 0}, {255, 165, 0}, {255, 255, 0}}, rnd),
		1,
		std::make_unique<constant_field>(vector2(0.0f, 98.0f)));
}

} // namespace

NONIUS_BENCHMARK("emitter fountain, 60 frames", [](nonius::chronometer meter) {
	auto rnd = make_ref<mt_random_source>();
	null_surface s;

	meter.measure([&](int) {
		auto e = make_fountain(rnd);
		for (int frame = 0; frame < 60; ++frame) {
			e->step(1.0f / 60.0f);
			e->draw(s);
		}
		return e->particles().size();
	});
})

NONIUS_BENCHMARK("actor list churn", [](nonius::chronometer meter) {
	null_surface s;

	meter.measure([&](int) {
		actor_list<> list;
		for (int frame = 0; frame < 60; ++frame) {
			for (int k = 0; k < 50; ++k)
				list.append(make_ref<dot>(vector2(k, frame), color(), 0.1f * (k % 10 + 1)));
			list.step(1.0f / 60.0f);
			list.draw(s);
		}
		return list.size();
	});
})

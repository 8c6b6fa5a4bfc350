#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ln/NodeId.hpp"
#include"Opener/Mod/BatchOpener/Correlator.hpp"
#include"Opener/Mod/Waiter.hpp"
#include"Opener/Shutdown.hpp"
#include"S/Bus.hpp"
#include"S/Tap.hpp"
#include<assert.h>
#include<stdexcept>

using Opener::Mod::BatchOpener::Correlator;
using Opener::Mod::BatchOpener::EventFilter;
using Opener::Mod::BatchOpener::FundingEvent;
using Opener::Mod::BatchOpener::make_funding_filter;

namespace {

auto const local = Ln::NodeId(
	"0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
);
auto const stranger = Ln::NodeId(
	"02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
);

FundingEvent event(Ln::NodeId const& node, std::uint64_t id) {
	auto e = FundingEvent();
	e.node_id = node;
	e.user_channel_id = id;
	e.counterparty_node_id = stranger;
	e.channel_value = Ln::Amount::sat(100000 + id);
	e.output_script = std::vector<std::uint8_t>(34, std::uint8_t(id));
	return e;
}

EventFilter any_with_id(std::uint64_t tag, std::uint64_t id) {
	auto f = EventFilter();
	f.user_channel_id = tag;
	f.matches = [id](FundingEvent const& e) {
		return e.user_channel_id == id;
	};
	return f;
}

}

int main() {
	auto bus = S::Bus();
	Opener::Mod::Waiter waiter(bus);
	S::Tap<FundingEvent> tap(bus);

	auto c = Correlator(waiter, tap.subscribe());

	/* Bad intervals are refused.  */
	auto thrown = false;
	try {
		auto fs = std::list<EventFilter>();
		fs.push_back(make_funding_filter(local, 1));
		c.wait_for_events(fs, 1.0, 0);
	} catch (std::invalid_argument const&) {
		thrown = true;
	}
	assert(thrown);

	auto start = double();

	auto code = Ev::lift().then([&]() {
		/* Nothing to wait for.  */
		return c.wait_for_events(std::list<EventFilter>(), 10.0, 1.0);
	}).then([&](std::vector<FundingEvent> es) {
		assert(es.empty());

		return bus.raise(event(local, 1));
	}).then([&]() {
		/* Same id, but raised for another local node.  */
		return bus.raise(event(stranger, 2));
	}).then([&]() {
		return bus.raise(event(local, 9));
	}).then([&]() {
		auto fs = std::list<EventFilter>();
		fs.push_back(make_funding_filter(local, 1));
		fs.push_back(make_funding_filter(local, 2));
		start = Ev::now();
		return c.wait_for_events(fs, 0.05, 0.01);
	}).then([&](std::vector<FundingEvent> es) {
		/* Times out with only the one match.  */
		assert(Ev::now() - start >= 0.04);
		assert(es.size() == 1);
		assert(es[0].user_channel_id == 1);
		assert(es[0].node_id == local);
		assert(es[0].channel_value == Ln::Amount::sat(100001));

		/* An event retires only the first filter it
		 * satisfies.  */
		return bus.raise(event(local, 5));
	}).then([&]() {
		auto fs = std::list<EventFilter>();
		fs.push_back(any_with_id(100, 5));
		fs.push_back(any_with_id(200, 5));
		return c.wait_for_events(fs, 0.03, 0.01);
	}).then([&](std::vector<FundingEvent> es) {
		assert(es.size() == 1);

		/* Events that arrive while waiting are
		 * picked up, and the wait ends as soon as
		 * all filters are satisfied.  */
		auto late = Ev::lift().then([&]() {
			return waiter.wait(0.02);
		}).then([&]() {
			return bus.raise(event(local, 7));
		}).then([&]() {
			return bus.raise(event(local, 6));
		});
		return Ev::concurrent(late);
	}).then([&]() {
		auto fs = std::list<EventFilter>();
		fs.push_back(make_funding_filter(local, 6));
		fs.push_back(make_funding_filter(local, 7));
		start = Ev::now();
		return c.wait_for_events(fs, 5.0, 0.01);
	}).then([&](std::vector<FundingEvent> es) {
		assert(Ev::now() - start < 4.0);
		/* In the order they matched.  */
		assert(es.size() == 2);
		assert(es[0].user_channel_id == 7);
		assert(es[1].user_channel_id == 6);

		/* Shutdown ends a wait in progress.  */
		auto stop = waiter.wait(0.02).then([&]() {
			return bus.raise(Opener::Shutdown());
		});
		return Ev::concurrent(stop);
	}).then([&]() {
		auto fs = std::list<EventFilter>();
		fs.push_back(make_funding_filter(local, 8));
		return c.wait_for_events(fs, 5.0, 0.01).then([](std::vector<FundingEvent>) {
			return Ev::lift(false);
		}).catching<Opener::Shutdown>([](Opener::Shutdown const&) {
			return Ev::lift(true);
		});
	}).then([&](bool stopped) {
		assert(stopped);
		return Ev::lift(0);
	});

	return Ev::start(code);
}

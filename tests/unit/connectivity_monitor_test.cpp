#include "services/ConnectivityMonitor.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <vector>
#include <QCoreApplication>

namespace {

using test_support::FakeBackendClient;

void TestProbeCycleAndFlips() {
	auto client = std::make_unique<FakeBackendClient>();
	client->health = { false, true, true, false };
	FakeBackendClient* fake = client.get();

	ProbeParams p;
	p.offlineProbeMs = 5000;
	p.onlineKeepAliveMs = 30000;
	ConnectivityMonitor monitor(std::move(client), p);

	std::vector<ConnectivityState> states;
	std::vector<bool> flips;
	QObject::connect(&monitor, &ConnectivityMonitor::stateChanged,
	                 [&](ConnectivityState s) { states.push_back(s); });
	QObject::connect(&monitor, &ConnectivityMonitor::reachabilityChanged,
	                 [&](bool online) { flips.push_back(online); });

	assert(monitor.state() == ConnectivityState::Offline);

	monitor.probeNow();
	assert(monitor.state() == ConnectivityState::Offline);
	assert(monitor.nextProbeDelayMs() == 5000);

	monitor.probeNow();
	assert(monitor.isOnline());
	assert(monitor.nextProbeDelayMs() == 30000);

	monitor.probeNow();
	monitor.probeNow();
	assert(monitor.state() == ConnectivityState::Offline);

	const std::vector<ConnectivityState> expected{
		ConnectivityState::Probing, ConnectivityState::Offline,
		ConnectivityState::Probing, ConnectivityState::Online,
		ConnectivityState::Probing, ConnectivityState::Online,
		ConnectivityState::Probing, ConnectivityState::Offline,
	};
	assert(states == expected);
	assert(flips.size() == 2);
	assert(flips[0] == true);
	assert(flips[1] == false);
	assert(fake->healthCalls == 4);
}

void TestStoppedMonitorDoesNotProbe() {
	auto client = std::make_unique<FakeBackendClient>();
	FakeBackendClient* fake = client.get();
	ConnectivityMonitor monitor(std::move(client), ProbeParams{});

	monitor.stop();
	monitor.probeNow();
	assert(fake->healthCalls == 0);
	assert(monitor.state() == ConnectivityState::Offline);
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestProbeCycleAndFlips();
	TestStoppedMonitorDoesNotProbe();

	std::cout << "attendance_unit_connectivity_monitor: pass\n";
	return 0;
}

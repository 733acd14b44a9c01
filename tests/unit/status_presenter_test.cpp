#include "presenter/StatusPresenter.hpp"

#include <cassert>
#include <iostream>
#include <QCoreApplication>

namespace {

void TestOfflineIsShownOnEveryReport() {
	StatusPresenter presenter(nullptr);
	int shown = 0;
	QObject::connect(&presenter, &StatusPresenter::statusChanged, [&](const QString&) { ++shown; });

	presenter.presentConnectivity(ConnectivityState::Offline);
	presenter.presentConnectivity(ConnectivityState::Probing);
	presenter.presentConnectivity(ConnectivityState::Offline);
	presenter.presentConnectivity(ConnectivityState::Offline);
	assert(shown == 3);
	assert(presenter.lastMessage().startsWith("Offline"));

	presenter.presentSyncStatus(4, "timeout");
	presenter.presentSyncStatus(4, "timeout");
	assert(shown == 5);
	assert(presenter.pendingCount() == 4);
	assert(presenter.statusLine().contains("last error: timeout"));

	presenter.presentConnectivity(ConnectivityState::Offline);
	assert(presenter.lastMessage().contains("pending 4"));
}

void TestOnlineRepeatsAreCollapsed() {
	StatusPresenter presenter(nullptr);
	int shown = 0;
	QObject::connect(&presenter, &StatusPresenter::statusChanged, [&](const QString&) { ++shown; });

	presenter.presentConnectivity(ConnectivityState::Online);
	presenter.presentConnectivity(ConnectivityState::Probing);
	presenter.presentConnectivity(ConnectivityState::Online);
	assert(shown == 1);
	assert(presenter.connectivity() == ConnectivityState::Online);

	presenter.presentSyncStatus(0, QString());
	presenter.presentSyncStatus(0, QString());
	assert(shown == 1);
	presenter.presentSyncStatus(2, QString());
	assert(shown == 2);
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestOfflineIsShownOnEveryReport();
	TestOnlineRepeatsAreCollapsed();

	std::cout << "attendance_unit_status_presenter: pass\n";
	return 0;
}

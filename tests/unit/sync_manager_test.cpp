#include "services/SyncManager.hpp"
#include "services/EventStore.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include <QTemporaryDir>

namespace {

using test_support::FakeBackendClient;
using test_support::localMs;
using test_support::makeEvent;

struct Harness {
	QTemporaryDir dir;
	std::unique_ptr<EventStore> store;
	FakeBackendClient* backend = nullptr;
	std::unique_ptr<SyncManager> sync;
	qint64 now = 0;
	std::vector<qint64> sendTimes;

	explicit Harness(SyncParams params = SyncParams{}) {
		store = std::make_unique<EventStore>(dir.filePath("att.db"));
		assert(store->initializeDatabase());

		auto client = std::make_unique<FakeBackendClient>();
		backend = client.get();
		backend->afterPost = [this](const AttendanceEvent&) { sendTimes.push_back(now); };

		sync = std::make_unique<SyncManager>(store.get(), std::move(client), params);
		sync->setClock([this] { return now; });
	}

	~Harness() {
		sync.reset();
		store->releaseThreadConnection();
	}
};

void TestResendingSameEventKeepsOneRecord() {
	Harness h;
	const auto e = makeEvent("e1", "P1", localMs(8, 0));
	for (int i = 0; i < 3; ++i) {
		assert(h.store->append(e));
		assert(h.backend->postAttendance(e).status == DeliveryStatus::Delivered);
	}
	assert(h.backend->recorded.size() == 1);
	assert(h.store->countPending() == 1);
}

void TestOfflineEventsDeliveredInOrderOnceOnline() {
	Harness h;
	assert(h.store->append(makeEvent("c", "P3", localMs(8, 3))));
	assert(h.store->append(makeEvent("a", "P1", localMs(8, 1))));
	assert(h.store->append(makeEvent("b", "P2", localMs(8, 2))));

	const auto offline = h.sync->runOnce();
	assert(offline.skipped);
	assert(h.backend->sent.empty());

	h.sync->onConnectivityChanged(ConnectivityState::Probing);
	assert(h.backend->sent.empty());

	h.sync->onConnectivityChanged(ConnectivityState::Online);
	assert(h.backend->sent.size() == 3);
	assert(h.backend->sent[0] == "a");
	assert(h.backend->sent[1] == "b");
	assert(h.backend->sent[2] == "c");
	assert(h.store->countPending() == 0);
	assert(h.store->find("b")->syncStatus == SyncStatus::Synced);
}

void TestTransientFailuresBackOffThenSucceed() {
	Harness h;
	h.backend->script = { DeliveryStatus::Transient, DeliveryStatus::Transient, DeliveryStatus::Delivered };
	assert(h.store->append(makeEvent("e1", "P1", localMs(8, 0))));

	h.now = 0;
	h.sync->onConnectivityChanged(ConnectivityState::Online);
	assert(h.backend->sent.size() == 1);
	assert(h.sync->nextAttemptAt() == 2000);

	h.now = 1000;
	assert(h.sync->runOnce().skipped);
	assert(h.backend->sent.size() == 1);

	h.now = 2000;
	auto r = h.sync->runOnce();
	assert(r.transientFailure);
	assert(h.sync->nextAttemptAt() == 6000);

	h.now = 6000;
	r = h.sync->runOnce();
	assert(r.synced == 1);

	assert(h.backend->sent.size() == 3);
	assert(h.sendTimes.size() == 3);
	assert(h.sendTimes[1] - h.sendTimes[0] < h.sendTimes[2] - h.sendTimes[1]);

	const auto row = h.store->find("e1");
	assert(row->syncStatus == SyncStatus::Synced);
	assert(row->attempts == 3);
	assert(h.sync->nextAttemptAt() == 0);
	assert(h.sync->backoff().peek() == 2000);
}

void TestBackoffIsCapped() {
	Backoff b(2000, 5000);
	assert(b.next() == 2000);
	assert(b.next() == 4000);
	assert(b.next() == 5000);
	assert(b.next() == 5000);
	b.reset();
	assert(b.next() == 2000);
}

void TestRejectionIsFinalAfterOneAttempt() {
	Harness h;
	h.backend->script = { DeliveryStatus::Rejected };
	assert(h.store->append(makeEvent("e1", "P9", localMs(8, 0))));

	QString rejectedId, rejectedReason;
	QObject::connect(h.sync.get(), &SyncManager::eventRejected,
	                 [&](const QString& id, const QString&, const QString& reason) {
		rejectedId = id;
		rejectedReason = reason;
	});

	h.sync->onConnectivityChanged(ConnectivityState::Online);
	h.now = 100000;
	h.sync->runOnce();
	h.sync->runOnce();

	assert(h.backend->sent.size() == 1);
	assert(rejectedId == "e1");
	assert(rejectedReason == "unknown person");

	const auto row = h.store->find("e1");
	assert(row->syncStatus == SyncStatus::Failed);
	assert(row->permanent);
	assert(row->attempts == 1);

	QVector<AttendanceEvent> failed;
	assert(h.store->listFailed(&failed) && failed.size() == 1);
}

void TestExhaustedHeadIsSkipped() {
	SyncParams p;
	p.maxAttempts = 2;
	Harness h(p);
	h.backend->script = { DeliveryStatus::Transient, DeliveryStatus::Transient };
	assert(h.store->append(makeEvent("head", "P1", localMs(8, 0))));
	assert(h.store->append(makeEvent("next", "P2", localMs(8, 1))));

	h.sync->onConnectivityChanged(ConnectivityState::Online);
	h.now = 2000;
	h.sync->runOnce();
	assert(h.backend->sent.size() == 2);

	h.now = 6000;
	h.sync->runOnce();
	assert(h.backend->sent.size() == 3);
	assert(h.backend->sent[2] == "next");
	assert(h.store->find("next")->syncStatus == SyncStatus::Synced);

	const auto head = h.store->find("head");
	assert(head->syncStatus == SyncStatus::Failed);
	assert(head->attempts == 2);
}

void TestReconnectResetsBackoff() {
	Harness h;
	h.backend->script = { DeliveryStatus::Transient, DeliveryStatus::Transient };
	assert(h.store->append(makeEvent("e1", "P1", localMs(8, 0))));

	h.sync->onConnectivityChanged(ConnectivityState::Online);
	h.now = 2000;
	h.sync->runOnce();
	assert(h.sync->nextAttemptAt() == 6000);

	h.sync->onConnectivityChanged(ConnectivityState::Offline);
	h.now = 2500;
	h.sync->onConnectivityChanged(ConnectivityState::Online);
	assert(h.backend->sent.size() == 3);
	assert(h.store->find("e1")->syncStatus == SyncStatus::Synced);
}

void TestDropMidBatchLeavesRestQueued() {
	Harness h;
	assert(h.store->append(makeEvent("a", "P1", localMs(8, 1))));
	assert(h.store->append(makeEvent("b", "P2", localMs(8, 2))));
	assert(h.store->append(makeEvent("c", "P3", localMs(8, 3))));

	h.backend->script = { DeliveryStatus::Delivered, DeliveryStatus::Transient };
	h.backend->afterPost = [&h](const AttendanceEvent& e) {
		if (e.eventId == "b") h.sync->onConnectivityChanged(ConnectivityState::Offline);
	};

	int lastPending = -1;
	QString lastError;
	QObject::connect(h.sync.get(), &SyncManager::syncStatusChanged, [&](int pending, const QString& err) {
		lastPending = pending;
		lastError = err;
	});

	h.sync->onConnectivityChanged(ConnectivityState::Online);
	assert(h.backend->sent.size() == 2);
	assert(h.store->find("a")->syncStatus == SyncStatus::Synced);
	assert(h.store->find("b")->syncStatus == SyncStatus::Failed);
	assert(h.store->find("c")->syncStatus == SyncStatus::Pending);
	assert(!h.sync->isOnline());
	assert(lastPending == 2);
	assert(!lastError.isEmpty());
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestResendingSameEventKeepsOneRecord();
	TestOfflineEventsDeliveredInOrderOnceOnline();
	TestTransientFailuresBackOffThenSucceed();
	TestBackoffIsCapped();
	TestRejectionIsFinalAfterOneAttempt();
	TestExhaustedHeadIsSkipped();
	TestReconnectResetsBackoff();
	TestDropMidBatchLeavesRestQueued();

	std::cout << "attendance_unit_sync_manager: pass\n";
	return 0;
}

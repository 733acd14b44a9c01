#include "services/EventStore.hpp"
#include "test_support.hpp"

#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>

namespace {

using test_support::localMs;
using test_support::makeEvent;

void TestPendingIsOrderedByOccurredAt() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());

	assert(store.append(makeEvent("e3", "P3", localMs(8, 3))));
	assert(store.append(makeEvent("e1", "P1", localMs(8, 1))));
	assert(store.append(makeEvent("e2", "P2", localMs(8, 2))));

	QVector<AttendanceEvent> rows;
	assert(store.listPending(&rows));
	assert(rows.size() == 3);
	assert(rows[0].eventId == "e1");
	assert(rows[1].eventId == "e2");
	assert(rows[2].eventId == "e3");
	assert(rows[0].syncStatus == SyncStatus::Pending);
	assert(rows[0].attempts == 0);
	assert(rows[0].kind == EventKind::CheckIn);
	store.releaseThreadConnection();
}

void TestDuplicateAppendKeepsOneRecord() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());

	const auto e = makeEvent("dup", "P1", localMs(8, 0));
	for (int i = 0; i < 5; ++i) assert(store.append(e));

	assert(store.countPending() == 1);
	store.releaseThreadConnection();
}

void TestTransitionsAndAttempts() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());
	assert(store.append(makeEvent("e1", "P1", localMs(8, 0))));

	assert(store.markSyncing("e1"));
	assert(store.find("e1")->syncStatus == SyncStatus::Syncing);
	assert(store.find("e1")->attempts == 1);

	// Syncing -> Syncing is not a new attempt
	assert(store.markSyncing("e1"));
	assert(store.find("e1")->attempts == 1);

	assert(store.markFailed("e1", "timeout"));
	auto row = store.find("e1");
	assert(row->syncStatus == SyncStatus::Failed);
	assert(row->lastError == "timeout");

	QVector<AttendanceEvent> rows;
	assert(store.listPending(&rows) && rows.size() == 1);

	assert(store.markSyncing("e1"));
	assert(store.markSynced("e1"));
	assert(store.markSynced("e1"));
	row = store.find("e1");
	assert(row->syncStatus == SyncStatus::Synced);
	assert(row->attempts == 2);
	assert(row->lastError.isEmpty());

	// terminal: nothing moves a Synced event back
	assert(store.markFailed("e1", "late"));
	assert(store.find("e1")->syncStatus == SyncStatus::Synced);
	assert(store.listPending(&rows) && rows.isEmpty());
	assert(!store.find("missing").has_value());
	store.releaseThreadConnection();
}

void TestRejectedIsExcludedButQueryable() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());
	assert(store.append(makeEvent("bad", "P9", localMs(8, 0))));
	assert(store.append(makeEvent("good", "P1", localMs(8, 1))));

	assert(store.markSyncing("bad"));
	assert(store.markRejected("bad", "unknown person"));

	QVector<AttendanceEvent> rows;
	assert(store.listPending(&rows));
	assert(rows.size() == 1 && rows[0].eventId == "good");

	assert(store.listFailed(&rows));
	assert(rows.size() == 1);
	assert(rows[0].eventId == "bad");
	assert(rows[0].permanent);
	assert(rows[0].lastError == "unknown person");

	// never resent
	assert(store.markSyncing("bad"));
	assert(store.find("bad")->attempts == 1);
	store.releaseThreadConnection();
}

void TestRetryCeilingDropsExhaustedEvents() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	store.setRetryCeiling(2);
	assert(store.initializeDatabase());
	assert(store.append(makeEvent("e1", "P1", localMs(8, 0))));

	for (int i = 0; i < 2; ++i) {
		assert(store.markSyncing("e1"));
		assert(store.markFailed("e1", "HTTP 503"));
	}
	QVector<AttendanceEvent> rows;
	assert(store.listPending(&rows) && rows.isEmpty());
	assert(store.countPending() == 0);
	assert(store.listFailed(&rows) && rows.size() == 1);
	assert(!rows[0].permanent);
	store.releaseThreadConnection();
}

void TestInFlightEventsRecoveredOnReopen() {
	QTemporaryDir dir;
	const QString path = dir.filePath("att.db");
	{
		EventStore store(path);
		assert(store.initializeDatabase());
		assert(store.append(makeEvent("e1", "P1", localMs(8, 0))));
		assert(store.markSyncing("e1"));
	}

	EventStore store(path);
	assert(store.initializeDatabase());
	const auto row = store.find("e1");
	assert(row->syncStatus == SyncStatus::Failed);
	assert(row->lastError == "interrupted");

	QVector<AttendanceEvent> rows;
	assert(store.listPending(&rows) && rows.size() == 1);
	store.releaseThreadConnection();
}

void TestPurgeAndListSince() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());
	assert(store.append(makeEvent("old", "P1", localMs(7, 0))));
	assert(store.append(makeEvent("new", "P2", localMs(9, 0))));

	QVector<AttendanceEvent> rows;
	assert(store.listSince(localMs(8, 0), &rows));
	assert(rows.size() == 1 && rows[0].eventId == "new");

	assert(store.markSyncing("old") && store.markSynced("old"));
	// pending rows are never purged
	assert(store.purgeSynced(QDateTime::currentMSecsSinceEpoch() + 1000) == 1);
	assert(!store.find("old").has_value());
	assert(store.find("new").has_value());
	store.releaseThreadConnection();
}

void TestSystemLogsRoundTrip() {
	QTemporaryDir dir;
	EventStore store(dir.filePath("att.db"));
	assert(store.initializeDatabase());

	const QDateTime now = QDateTime::currentDateTime();
	assert(store.insertSystemLog(1, "SYNC", "backend reachable", now));
	assert(store.insertSystemLog(3, "SYNC", "event rejected", now, "eventId=e1"));
	assert(store.insertSystemLog(1, "FSM", "P1 check_in", now));

	QVector<SystemLog> rows;
	int total = 0;
	assert(store.selectSystemLogs(0, 10, 0, "SYNC", QString(), &rows, &total));
	assert(total == 2 && rows.size() == 2);
	assert(rows[0].message == "event rejected");
	assert(rows[0].extra == "eventId=e1");

	assert(store.selectSystemLogs(0, 10, 3, QString(), QString(), &rows, &total));
	assert(total == 1);
	store.releaseThreadConnection();
}

void TestUnopenableStoreReportsError() {
	EventStore store(QStringLiteral("/proc/attendance-kiosk-test/missing.db"));
	assert(!store.initializeDatabase());
	assert(!store.lastError().isEmpty());
	assert(!store.append(makeEvent("e1", "P1", localMs(8, 0))));
	assert(store.countPending() == -1);
	store.releaseThreadConnection();
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestPendingIsOrderedByOccurredAt();
	TestDuplicateAppendKeepsOneRecord();
	TestTransitionsAndAttempts();
	TestRejectedIsExcludedButQueryable();
	TestRetryCeilingDropsExhaustedEvents();
	TestInFlightEventsRecoveredOnReopen();
	TestPurgeAndListSince();
	TestSystemLogsRoundTrip();
	TestUnopenableStoreReportsError();

	std::cout << "attendance_unit_event_store: pass\n";
	return 0;
}

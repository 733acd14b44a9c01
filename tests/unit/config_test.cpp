#include "config/KioskConfig.hpp"
#include "include/errors.hpp"

#include <cassert>
#include <iostream>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

namespace {

QString WriteConfig(const QTemporaryDir& dir, const QString& name, const QByteArray& json) {
	const QString path = dir.filePath(name);
	QFile f(path);
	const bool ok = f.open(QIODevice::WriteOnly);
	assert(ok);
	f.write(json);
	return path;
}

template <typename Fn>
bool ThrowsConfigError(Fn fn) {
	try {
		fn();
	} catch (const ConfigError&) {
		return true;
	}
	return false;
}

void TestDefaults() {
	const KioskConfig c = KioskConfig::load(QString(), QProcessEnvironment());
	assert(c.backend.baseUrl == "http://localhost:8000");
	assert(c.backend.deviceId == "stb-01");
	assert(c.backend.timeoutMs == 12000);
	assert(c.backend.healthTimeoutMs == 3000);
	assert(c.track.verifyWindowSize == 3);
	assert(c.track.verifyMajority == 2);
	assert(c.track.verifyThreshold == 0.8);
	assert(c.track.verifyTimeoutMs == 2000);
	assert(c.track.trackExpiryMs == 1500);
	assert(c.cooldownMs == 0);
	assert(c.windows.size() == 2);
	assert(c.sync.maxAttempts == 10);
	assert(c.sync.backoffBaseMs == 2000);
	assert(c.sync.backoffCapMs == 60000);
	assert(c.probe.offlineProbeMs == 5000);
	assert(c.probe.onlineKeepAliveMs == 30000);
	assert(c.storePath == "data/attendance.db");
	assert(c.storeRetryCount == 1);
}

void TestFileValuesAndEnvironmentOverrides() {
	QTemporaryDir dir;
	const QString path = WriteConfig(dir, "kiosk.json", R"({
		"api": { "base": "http://10.0.0.2:8000", "timeoutMs": 8000 },
		"device": { "id": "gate-3", "token": "secret" },
		"track": { "verifyWindowSize": 5, "verifyMajority": 3, "verifyThreshold": 0.75 },
		"cooldown": { "ms": 600000 },
		"windows": [
			{ "name": "in", "start": "06:00", "end": "11:00", "kind": "check_in" },
			{ "name": "out", "start": "15:00", "end": "24:00", "kind": "check_out" }
		],
		"sync": { "maxAttempts": 4 },
		"store": { "path": "/var/lib/kiosk/a.db", "retentionDays": 7 }
	})");

	QProcessEnvironment env;
	env.insert("DEVICE_ID", "gate-9");
	env.insert("API_TIMEOUT", "2.5");
	const KioskConfig c = KioskConfig::load(path, env);

	assert(c.backend.baseUrl == "http://10.0.0.2:8000");
	assert(c.backend.deviceId == "gate-9");
	assert(c.backend.deviceToken == "secret");
	assert(c.backend.timeoutMs == 2500);
	assert(c.track.verifyWindowSize == 5);
	assert(c.track.verifyMajority == 3);
	assert(c.track.verifyThreshold == 0.75);
	assert(c.cooldownMs == 600000);
	assert(c.windows.size() == 2);
	assert(c.windows[1].endMinute == 1440);
	assert(c.windows[1].kind == EventKind::CheckOut);
	assert(c.sync.maxAttempts == 4);
	assert(c.sync.retentionDays == 7);
	assert(c.storePath == "/var/lib/kiosk/a.db");
}

void TestInvalidValuesFailFast() {
	QTemporaryDir dir;
	const QProcessEnvironment env;

	const QString majority = WriteConfig(dir, "m.json", R"({"track":{"verifyWindowSize":3,"verifyMajority":4}})");
	assert(ThrowsConfigError([&] { KioskConfig::load(majority, env); }));

	const QString overlap = WriteConfig(dir, "o.json", R"({"windows":[
		{"name":"a","start":"06:00","end":"12:00"},{"name":"b","start":"11:00","end":"13:00"}]})");
	assert(ThrowsConfigError([&] { KioskConfig::load(overlap, env); }));

	const QString wrongType = WriteConfig(dir, "t.json", R"({"sync":{"maxAttempts":"ten"}})");
	assert(ThrowsConfigError([&] { KioskConfig::load(wrongType, env); }));

	const QString broken = WriteConfig(dir, "b.json", "{ not json");
	assert(ThrowsConfigError([&] { KioskConfig::load(broken, env); }));

	assert(ThrowsConfigError([&] { KioskConfig::load(dir.filePath("missing.json"), env); }));

	QProcessEnvironment badEnv;
	badEnv.insert("API_TIMEOUT", "soon");
	assert(ThrowsConfigError([&] { KioskConfig::load(QString(), badEnv); }));

	const QString hugeInt = WriteConfig(dir, "h.json", R"({"track":{"verifyTimeoutMs":1e12}})");
	assert(ThrowsConfigError([&] { KioskConfig::load(hugeInt, env); }));

	const QString hugeNegative = WriteConfig(dir, "n.json", R"({"sync":{"maxAttempts":-1e12}})");
	assert(ThrowsConfigError([&] { KioskConfig::load(hugeNegative, env); }));

	const QString hugeMillis = WriteConfig(dir, "c.json", R"({"cooldown":{"ms":1e300}})");
	assert(ThrowsConfigError([&] { KioskConfig::load(hugeMillis, env); }));

	QProcessEnvironment hugeTimeout;
	hugeTimeout.insert("API_TIMEOUT", "1e12");
	assert(ThrowsConfigError([&] { KioskConfig::load(QString(), hugeTimeout); }));

	QProcessEnvironment badUrl;
	badUrl.insert("API_BASE", "localhost:8000");
	assert(ThrowsConfigError([&] { KioskConfig::load(QString(), badUrl); }));
}

} // namespace

int main(int argc, char** argv) {
	QCoreApplication app(argc, argv);

	TestDefaults();
	TestFileValuesAndEnvironmentOverrides();
	TestInvalidValuesFailFast();

	std::cout << "attendance_unit_config: pass\n";
	return 0;
}

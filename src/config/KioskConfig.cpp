#include "config/KioskConfig.hpp"
#include "include/errors.hpp"
#include "log/log_categories.hpp"

#include <limits>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace {

QJsonObject section(const QJsonObject& root, const char* name)
{
	const QJsonValue v = root.value(QLatin1String(name));
	if (v.isUndefined() || v.isNull()) return {};
	if (!v.isObject()) throw ConfigError(QStringLiteral("'%1' must be an object").arg(QLatin1String(name)));
	return v.toObject();
}

QString str(const QJsonObject& o, const char* key, const QString& def, const char* sec)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined()) return def;
	if (!v.isString())
		throw ConfigError(QStringLiteral("%1.%2 must be a string").arg(QLatin1String(sec), QLatin1String(key)));
	return v.toString();
}

double num(const QJsonObject& o, const char* key, double def, const char* sec)
{
	const QJsonValue v = o.value(QLatin1String(key));
	if (v.isUndefined()) return def;
	if (!v.isDouble())
		throw ConfigError(QStringLiteral("%1.%2 must be a number").arg(QLatin1String(sec), QLatin1String(key)));
	return v.toDouble();
}

int integer(const QJsonObject& o, const char* key, qint64 def, const char* sec)
{
	const double v = num(o, key, static_cast<double>(def), sec);
	if (!(v >= static_cast<double>(std::numeric_limits<int>::min())
	      && v <= static_cast<double>(std::numeric_limits<int>::max())))
		throw ConfigError(QStringLiteral("%1.%2 is out of range").arg(QLatin1String(sec), QLatin1String(key)));
	return static_cast<int>(v);
}

// millisecond values, limited to integers a double holds exactly
qint64 millis(const QJsonObject& o, const char* key, qint64 def, const char* sec)
{
	constexpr double kLimit = 9007199254740992.0;
	const double v = num(o, key, static_cast<double>(def), sec);
	if (!(v >= -kLimit && v <= kLimit))
		throw ConfigError(QStringLiteral("%1.%2 is out of range").arg(QLatin1String(sec), QLatin1String(key)));
	return static_cast<qint64>(v);
}

std::vector<WindowRule> parseWindows(const QJsonValue& v)
{
	if (!v.isArray()) throw ConfigError(QStringLiteral("'windows' must be an array"));

	std::vector<WindowRule> rules;
	for (const QJsonValue& item : v.toArray()) {
		if (!item.isObject()) throw ConfigError(QStringLiteral("windows[] entries must be objects"));
		const QJsonObject o = item.toObject();

		WindowRule r;
		r.name = str(o, "name", QString(), "windows");
		if (!AttendanceWindows::parseClock(str(o, "start", QString(), "windows"), &r.startMinute))
			throw ConfigError(QStringLiteral("windows '%1': bad start time").arg(r.name));
		if (!AttendanceWindows::parseClock(str(o, "end", QString(), "windows"), &r.endMinute))
			throw ConfigError(QStringLiteral("windows '%1': bad end time").arg(r.name));

		const QString kind = str(o, "kind", QStringLiteral("check_in"), "windows");
		if (kind != QLatin1String("check_in") && kind != QLatin1String("check_out")
		    && kind != QLatin1String("in") && kind != QLatin1String("out"))
			throw ConfigError(QStringLiteral("windows '%1': kind must be check_in or check_out").arg(r.name));
		r.kind = States::eventKindFromString(kind);
		rules.push_back(r);
	}
	return rules;
}

} // namespace

KioskConfig KioskConfig::fromJson(const QJsonObject& root)
{
	KioskConfig c;

	const QJsonObject api = section(root, "api");
	c.backend.baseUrl = str(api, "base", c.backend.baseUrl, "api");
	c.backend.timeoutMs = integer(api, "timeoutMs", c.backend.timeoutMs, "api");
	c.backend.healthTimeoutMs = integer(api, "healthTimeoutMs", c.backend.healthTimeoutMs, "api");

	const QJsonObject device = section(root, "device");
	c.backend.deviceId = str(device, "id", c.backend.deviceId, "device");
	c.backend.deviceToken = str(device, "token", c.backend.deviceToken, "device");

	const QJsonObject track = section(root, "track");
	c.track.verifyWindowSize = integer(track, "verifyWindowSize", c.track.verifyWindowSize, "track");
	c.track.verifyMajority = integer(track, "verifyMajority", c.track.verifyMajority, "track");
	c.track.verifyThreshold = num(track, "verifyThreshold", c.track.verifyThreshold, "track");
	c.track.verifyTimeoutMs = integer(track, "verifyTimeoutMs", c.track.verifyTimeoutMs, "track");
	c.track.trackExpiryMs = integer(track, "expiryMs", c.track.trackExpiryMs, "track");
	c.track.maxTracks = integer(track, "maxTracks", c.track.maxTracks, "track");

	const QJsonObject cooldown = section(root, "cooldown");
	c.cooldownMs = millis(cooldown, "ms", 0, "cooldown");

	if (root.contains(QLatin1String("windows")))
		c.windows = parseWindows(root.value(QLatin1String("windows")));

	const QJsonObject sync = section(root, "sync");
	c.sync.maxAttempts = integer(sync, "maxAttempts", c.sync.maxAttempts, "sync");
	c.sync.backoffBaseMs = millis(sync, "backoffBaseMs", c.sync.backoffBaseMs, "sync");
	c.sync.backoffCapMs = millis(sync, "backoffCapMs", c.sync.backoffCapMs, "sync");
	c.sync.syncIntervalMs = integer(sync, "intervalMs", c.sync.syncIntervalMs, "sync");

	const QJsonObject probe = section(root, "probe");
	c.probe.offlineProbeMs = integer(probe, "offlineMs", c.probe.offlineProbeMs, "probe");
	c.probe.onlineKeepAliveMs = integer(probe, "onlineMs", c.probe.onlineKeepAliveMs, "probe");

	const QJsonObject store = section(root, "store");
	c.storePath = str(store, "path", c.storePath, "store");
	c.sync.retentionDays = integer(store, "retentionDays", c.sync.retentionDays, "store");
	c.storeRetryCount = integer(store, "retryCount", c.storeRetryCount, "store");

	const QJsonObject log = section(root, "log");
	c.logDir = str(log, "dir", c.logDir, "log");

	const QJsonObject app = section(root, "app");
	c.fps = integer(app, "fps", c.fps, "app");
	c.shutdownGraceMs = integer(app, "shutdownGraceMs", c.shutdownGraceMs, "app");

	return c;
}

void KioskConfig::applyEnvironment(const QProcessEnvironment& env)
{
	if (env.contains(QStringLiteral("API_BASE")))
		backend.baseUrl = env.value(QStringLiteral("API_BASE"));
	if (env.contains(QStringLiteral("DEVICE_ID")))
		backend.deviceId = env.value(QStringLiteral("DEVICE_ID"));
	if (env.contains(QStringLiteral("DEVICE_TOKEN")))
		backend.deviceToken = env.value(QStringLiteral("DEVICE_TOKEN"));
	if (env.contains(QStringLiteral("API_TIMEOUT"))) {
		bool ok = false;
		const double secs = env.value(QStringLiteral("API_TIMEOUT")).toDouble(&ok);
		if (!ok || !(secs > 0) || secs * 1000 > static_cast<double>(std::numeric_limits<int>::max()))
			throw ConfigError(QStringLiteral("API_TIMEOUT must be a positive number of seconds"));
		backend.timeoutMs = static_cast<int>(secs * 1000);
	}
	if (env.contains(QStringLiteral("KIOSK_DB_PATH")))
		storePath = env.value(QStringLiteral("KIOSK_DB_PATH"));
	if (env.contains(QStringLiteral("KIOSK_LOG_DIR")))
		logDir = env.value(QStringLiteral("KIOSK_LOG_DIR"));
}

void KioskConfig::validate() const
{
	if (backend.baseUrl.isEmpty()) throw ConfigError(QStringLiteral("api.base is empty"));
	if (!backend.baseUrl.startsWith(QLatin1String("http://")) && !backend.baseUrl.startsWith(QLatin1String("https://")))
		throw ConfigError(QStringLiteral("api.base must be an http(s) URL"));
	if (backend.timeoutMs <= 0) throw ConfigError(QStringLiteral("api.timeoutMs must be > 0"));
	if (backend.healthTimeoutMs <= 0) throw ConfigError(QStringLiteral("api.healthTimeoutMs must be > 0"));
	if (backend.deviceId.isEmpty()) throw ConfigError(QStringLiteral("device.id is empty"));

	if (track.verifyWindowSize < 1) throw ConfigError(QStringLiteral("track.verifyWindowSize must be >= 1"));
	if (track.verifyMajority < 1 || track.verifyMajority > track.verifyWindowSize)
		throw ConfigError(QStringLiteral("track.verifyMajority must be in 1..verifyWindowSize"));
	if (track.verifyThreshold < 0.0 || track.verifyThreshold > 1.0)
		throw ConfigError(QStringLiteral("track.verifyThreshold must be in 0..1"));
	if (track.verifyTimeoutMs <= 0) throw ConfigError(QStringLiteral("track.verifyTimeoutMs must be > 0"));
	if (track.trackExpiryMs <= 0) throw ConfigError(QStringLiteral("track.expiryMs must be > 0"));
	if (track.maxTracks < 1) throw ConfigError(QStringLiteral("track.maxTracks must be >= 1"));

	if (cooldownMs < 0) throw ConfigError(QStringLiteral("cooldown.ms must be >= 0"));

	const QString werr = AttendanceWindows(windows).validate();
	if (!werr.isEmpty()) throw ConfigError(QStringLiteral("windows: %1").arg(werr));

	if (sync.maxAttempts < 1) throw ConfigError(QStringLiteral("sync.maxAttempts must be >= 1"));
	if (sync.backoffBaseMs <= 0) throw ConfigError(QStringLiteral("sync.backoffBaseMs must be > 0"));
	if (sync.backoffCapMs < sync.backoffBaseMs)
		throw ConfigError(QStringLiteral("sync.backoffCapMs must be >= sync.backoffBaseMs"));
	if (sync.syncIntervalMs <= 0) throw ConfigError(QStringLiteral("sync.intervalMs must be > 0"));

	if (probe.offlineProbeMs <= 0 || probe.onlineKeepAliveMs <= 0)
		throw ConfigError(QStringLiteral("probe intervals must be > 0"));

	if (storePath.isEmpty()) throw ConfigError(QStringLiteral("store.path is empty"));
	if (storeRetryCount < 0) throw ConfigError(QStringLiteral("store.retryCount must be >= 0"));
	if (logDir.isEmpty()) throw ConfigError(QStringLiteral("log.dir is empty"));
	if (fps < 1 || fps > 120) throw ConfigError(QStringLiteral("app.fps must be in 1..120"));
	if (shutdownGraceMs < 0) throw ConfigError(QStringLiteral("app.shutdownGraceMs must be >= 0"));
}

KioskConfig KioskConfig::load(const QString& path, const QProcessEnvironment& env)
{
	KioskConfig c;

	if (!path.isEmpty()) {
		QFile f(path);
		if (!f.open(QIODevice::ReadOnly))
			throw ConfigError(QStringLiteral("cannot open config %1: %2").arg(path, f.errorString()));

		QJsonParseError perr;
		const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
		if (perr.error != QJsonParseError::NoError)
			throw ConfigError(QStringLiteral("%1: %2 at offset %3").arg(path, perr.errorString()).arg(perr.offset));
		if (!doc.isObject())
			throw ConfigError(QStringLiteral("%1: top level must be an object").arg(path));

		c = fromJson(doc.object());
		qCInfo(LC_CONFIG) << "[load] config read from" << path;
	} else {
		qCInfo(LC_CONFIG) << "[load] no config file, using defaults";
	}

	c.applyEnvironment(env);
	c.validate();
	return c;
}

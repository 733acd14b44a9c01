#include "services/AttendanceWindows.hpp"
#include <QDateTime>
#include <QRegularExpression>
#include <algorithm>

std::vector<WindowRule> AttendanceWindows::defaultRules()
{
		return {
			{ QStringLiteral("morning-in"),    0,      12 * 60, EventKind::CheckIn  },
			{ QStringLiteral("afternoon-out"), 12 * 60, 24 * 60, EventKind::CheckOut },
		};
}

bool AttendanceWindows::parseClock(const QString& hhmm, int* minuteOut)
{
		static const QRegularExpression re(QStringLiteral("^(\\d{1,2}):(\\d{2})$"));
		const auto m = re.match(hhmm.trimmed());
		if (!m.hasMatch()) return false;

		const int h = m.captured(1).toInt();
		const int mm = m.captured(2).toInt();
		if (mm > 59) return false;
		if (h == 24 && mm == 0) { *minuteOut = 24 * 60; return true; }
		if (h > 23) return false;

		*minuteOut = h * 60 + mm;
		return true;
}

std::optional<WindowMatch> AttendanceWindows::resolve(qint64 epochMs) const
{
		const QDateTime local = QDateTime::fromMSecsSinceEpoch(epochMs).toLocalTime();
		const QTime t = local.time();
		const int minute = t.hour() * 60 + t.minute();

		for (const auto& r : rules_) {
			if (minute >= r.startMinute && minute < r.endMinute) {
				WindowMatch w;
				w.name = r.name;
				w.kind = r.kind;
				w.key  = local.date().toString(QStringLiteral("yyyy-MM-dd")) + QLatin1Char('/') + r.name;
				return w;
			}
		}
		return std::nullopt;
}

QString AttendanceWindows::validate() const
{
		if (rules_.empty()) return QStringLiteral("no attendance windows configured");

		std::vector<WindowRule> sorted = rules_;
		std::sort(sorted.begin(), sorted.end(),
				[](const WindowRule& a, const WindowRule& b) { return a.startMinute < b.startMinute; });

		for (size_t i = 0; i < sorted.size(); ++i) {
			const auto& r = sorted[i];
			if (r.name.trimmed().isEmpty())
				return QStringLiteral("window without a name");
			if (r.startMinute < 0 || r.endMinute > 24 * 60 || r.startMinute >= r.endMinute)
				return QStringLiteral("window '%1' has an empty or out-of-day range").arg(r.name);
			if (i > 0 && sorted[i - 1].endMinute > r.startMinute)
				return QStringLiteral("windows '%1' and '%2' overlap").arg(sorted[i - 1].name, r.name);
			for (size_t j = 0; j < i; ++j) {
				if (sorted[j].name == r.name)
					return QStringLiteral("duplicate window name '%1'").arg(r.name);
			}
		}
		return {};
}

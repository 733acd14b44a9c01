#pragma once
#include <optional>
#include <vector>
#include <QString>
#include "include/states.hpp"

// Day-part during which one decision per person is allowed
struct WindowRule {
		QString		name;				// "morning-in"
		int			startMinute = 0;	// minutes since local midnight, inclusive
		int			endMinute = 0;		// exclusive, 1440 = end of day
		EventKind	kind = EventKind::CheckIn;
};

struct WindowMatch {
		QString		key;				// "<yyyy-MM-dd>/<name>", unique per calendar day
		QString		name;
		EventKind	kind = EventKind::CheckIn;
};

class AttendanceWindows {
public:
		AttendanceWindows() : rules_(defaultRules()) {}
		explicit AttendanceWindows(std::vector<WindowRule> rules) : rules_(std::move(rules)) {}

		static std::vector<WindowRule> defaultRules();

		// Window containing the local time of epochMs, if any
		std::optional<WindowMatch> resolve(qint64 epochMs) const;

		// Non-empty error text when rules overlap or are out of range
		QString validate() const;

		const std::vector<WindowRule>& rules() const { return rules_; }

		// "HH:mm" -> minutes since midnight; "24:00" is accepted as end of day
		static bool parseClock(const QString& hhmm, int* minuteOut);

private:
		std::vector<WindowRule> rules_;
};

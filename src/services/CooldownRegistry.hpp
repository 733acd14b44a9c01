#pragma once
#include <unordered_map>
#include <QString>
#include <QHash>

// PersonCooldown table. Written only by the decisioning path.
class CooldownRegistry {
public:
		struct Entry {
				qint64	lastDecisionAt = 0;
				QString	lastDecisionWindow;
		};

		// cooldownMs <= 0: a decision blocks the person for the whole window
		explicit CooldownRegistry(qint64 cooldownMs = 0) : cooldownMs_(cooldownMs) {}

		// true when a decision for personId in windowKey would be a duplicate
		bool isFresh(const QString& personId, const QString& windowKey, qint64 nowMs) const;

		void record(const QString& personId, const QString& windowKey, qint64 nowMs);

		// rebuild after restart; keeps the newest decision per person
		void restore(const QString& personId, const QString& windowKey, qint64 atMs);

		bool contains(const QString& personId) const { return table_.count(personId) > 0; }
		int size() const { return static_cast<int>(table_.size()); }
		void clear() { table_.clear(); }

private:
		struct QStringHash {
				size_t operator()(const QString& s) const { return qHash(s); }
		};

		qint64 cooldownMs_;
		std::unordered_map<QString, Entry, QStringHash> table_;
};

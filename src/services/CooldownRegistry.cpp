#include "services/CooldownRegistry.hpp"
#include "log/log_categories.hpp"

bool CooldownRegistry::isFresh(const QString& personId, const QString& windowKey, qint64 nowMs) const
{
		const auto it = table_.find(personId);
		if (it == table_.end()) return false;

		const Entry& e = it->second;
		if (e.lastDecisionWindow != windowKey) return false;

		if (cooldownMs_ > 0 && (nowMs - e.lastDecisionAt) >= cooldownMs_) {
			qCDebug(LC_FSM) << "[isFresh]" << personId << "cooldown elapsed in" << windowKey;
			return false;
		}
		return true;
}

void CooldownRegistry::record(const QString& personId, const QString& windowKey, qint64 nowMs)
{
		Entry& e = table_[personId];
		e.lastDecisionAt = nowMs;
		e.lastDecisionWindow = windowKey;
}

void CooldownRegistry::restore(const QString& personId, const QString& windowKey, qint64 atMs)
{
		auto it = table_.find(personId);
		if (it != table_.end() && it->second.lastDecisionAt >= atMs) return;
		record(personId, windowKey, atMs);
}

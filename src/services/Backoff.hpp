#pragma once
#include <QtGlobal>

// Exponential retry delay: base, 2*base, 4*base ... capped.
class Backoff {
public:
	Backoff(qint64 baseMs = 2000, qint64 capMs = 60000)
		: baseMs_(baseMs), capMs_(capMs) {}

	// delay to wait before the next attempt; doubles on every call
	qint64 next() {
		const qint64 d = current_ > 0 ? current_ : baseMs_;
		current_ = qMin(d * 2, capMs_);
		return qMin(d, capMs_);
	}

	// delay next() would return, without advancing
	qint64 peek() const { return qMin(current_ > 0 ? current_ : baseMs_, capMs_); }

	void reset() { current_ = 0; }

	qint64 baseMs() const { return baseMs_; }
	qint64 capMs() const { return capMs_; }

private:
	qint64 baseMs_;
	qint64 capMs_;
	qint64 current_ = 0;
};

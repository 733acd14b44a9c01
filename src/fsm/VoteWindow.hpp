#pragma once
#include <deque>
#include <QString>

// M-of-N confirmation over the last N frames for a single candidate.
// A vote for a different candidate restarts the window on that candidate.
class VoteWindow {
public:
		VoteWindow(int window = 3, int need = 2)
				: win_(window), need_(need) {}

		// frame names `candidate` above threshold
		bool vote(const QString& candidate) {
			if (!candidate_.isEmpty() && candidate != candidate_) {
					buf_.clear();
			}
			candidate_ = candidate;
			push(true);
			return confirmed();
		}

		// no match or weak score; the candidate is kept
		bool miss() {
			push(false);
			return confirmed();
		}

		bool confirmed() const {
			return !candidate_.isEmpty() && agreeing() >= need_;
		}

		int agreeing() const {
			int ok = 0;
			for (bool v : buf_) if (v) ok++;
			return ok;
		}

		const QString& candidate() const { return candidate_; }
		void reset() { buf_.clear(); candidate_.clear(); }

private:
		void push(bool v) {
			buf_.push_back(v);
			if ((int)buf_.size() > win_) buf_.pop_front();
		}

		int win_, need_;
		QString candidate_;
		std::deque<bool> buf_;
};

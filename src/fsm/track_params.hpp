#pragma once
#include <QtGlobal>

// Debounce/expiry parameters for one face track
struct TrackParams {
		int		verifyWindowSize	= 3;		// N: frames considered for the vote
		int		verifyMajority		= 2;		// M of N must agree
		double	verifyThreshold		= 0.80;		// minimum confidence for an agreeing vote
		qint64	verifyTimeoutMs		= 2000;		// undecided longer than this -> Unknown
		qint64	trackExpiryMs		= 1500;		// unreported longer than this -> Expired
		int		maxTracks			= 5;		// tracks decisioned per frame
};

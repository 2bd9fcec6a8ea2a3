#include <stdio.h>
#include <algorithm>
#include "dedup.h"

namespace clipmeter {

void ReadingDeduplicator::Seed(int64_t device, const Timestamp& time, int watts) {
	LastReading& last = Devices[device];
	last.Time         = time;
	last.Watts        = watts;
}

ReadingDeduplicator::Decision ReadingDeduplicator::Offer(int64_t device, const Timestamp& reportTime, int watts, const Timestamp& now, Timestamp& storeTime) {
	auto it = Devices.find(device);
	if (it == Devices.end()) {
		Seed(device, reportTime, watts);
		storeTime = reportTime;
		return Decision::Store;
	}

	LastReading& last = it->second;
	if (last.Time == reportTime) {
		if (last.Watts == watts)
			return Decision::Resend;
		// The gateway re-used a report time, but the production doesn't match.
		// We don't want to lose this change, so we stamp it with the current time.
		fprintf(stderr, "Duplicate SN%lld (%s): old %d new %d\n", (long long) device, reportTime.ToString().c_str(), last.Watts, watts);
		last.Time  = now;
		last.Watts = watts;
		storeTime  = now;
		return Decision::ConflictingResend;
	}

	// Always store the first reading of a day, otherwise the day's series would
	// not start where the inverter actually started.
	if (last.Watts == watts && last.Time.Day == reportTime.Day) {
		last.Time = reportTime;
		return Decision::Unchanged;
	}

	last.Time  = reportTime;
	last.Watts = watts;
	storeTime  = reportTime;
	return Decision::Store;
}

ReadingDeduplicator::Decision ReadingDeduplicator::OfferOffline(int64_t device, const Timestamp& reportTime, int watts, Timestamp& storeTime) {
	Timestamp after(reportTime.Day, std::min(reportTime.Seconds + 1, SecondsPerDay - 1));
	return Offer(device, reportTime, watts, after, storeTime);
}

const char* DedupDecisionToString(ReadingDeduplicator::Decision v) {
	switch (v) {
	case ReadingDeduplicator::Decision::Store: return "Store";
	case ReadingDeduplicator::Decision::Unchanged: return "Unchanged";
	case ReadingDeduplicator::Decision::Resend: return "Resend";
	case ReadingDeduplicator::Decision::ConflictingResend: return "ConflictingResend";
	}
	return "INVALID";
}

} // namespace clipmeter

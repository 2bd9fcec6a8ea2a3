#pragma once

#include <stdint.h>
#include <map>

#include "timeUtils.h"

namespace clipmeter {

// ReadingDeduplicator decides which inverter readings are worth storing.
// The gateway re-sends the same report many times, and an inverter's output often
// doesn't change between reports, so we only store a reading when the output changes.
// The Reconstructor fills the gaps back in when the data is read out again.
class ReadingDeduplicator {
public:
	enum class Decision {
		Store,             // New information. Store at the report time.
		Unchanged,         // Same watts as the last stored reading. Don't store.
		Resend,            // Same report time and watts as before. Don't store.
		ConflictingResend, // Same report time as before, but different watts. Store at 'now', so we don't lose it.
	};

	// Prime with the most recent stored reading of a device
	void Seed(int64_t device, const Timestamp& time, int watts);

	// Decide what to do with a reading. When the decision is Store or ConflictingResend,
	// storeTime is the time to store the reading at.
	Decision Offer(int64_t device, const Timestamp& reportTime, int watts, const Timestamp& now, Timestamp& storeTime);

	// Offer, for historical data where the wall clock means nothing. A conflicting resend
	// is stored one second after the report time, so it stays inside its own day.
	Decision OfferOffline(int64_t device, const Timestamp& reportTime, int watts, Timestamp& storeTime);

	size_t NumDevices() const { return Devices.size(); }

private:
	struct LastReading {
		Timestamp Time;
		int       Watts = 0;
	};
	std::map<int64_t, LastReading> Devices;
};

const char* DedupDecisionToString(ReadingDeduplicator::Decision v);

} // namespace clipmeter

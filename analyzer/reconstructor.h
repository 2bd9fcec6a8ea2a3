#pragma once

#include <stdint.h>
#include <map>

#include "types.h"
#include "telemetry.h"

namespace clipmeter {

// All devices' series for one calendar day
struct DayBatch {
	clipmeter::Date           Day;
	std::map<int64_t, Series> Devices; // Keyed by device serial number
};

// Append a reading to a device's series. If the gap since the previous sample is more than
// 1.5 x cadence, then the store skipped readings because the output did not change, so we
// first fill the gap with evenly spaced copies of the previous sample.
// Returns false (and appends nothing) if offset is not after the last sample.
bool AppendReading(Series& series, int offset, int watts, int cadenceSeconds);

// Reconstructor turns the sparse reading stream into dense per-day series.
// It pulls one day at a time from the cursor, so memory is bounded by one day of data.
class Reconstructor {
public:
	int CadenceSeconds = 331; // Expected seconds between telemetry updates

	Reconstructor(TelemetryCursor* cursor);

	// Fill batch with the next day of data. Returns false when the stream is exhausted,
	// or when the store failed (see Status). A day that was cut short by a store
	// failure is never returned.
	bool NextDay(DayBatch& batch);

	StoreResponse Status() const { return Cursor->Status(); }

	int NumDropped() const { return Dropped; } // Readings dropped because their time went backwards

private:
	TelemetryCursor* Cursor     = nullptr;
	Reading          Pending;             // First reading of the next day
	bool             HasPending = false;
	int              Dropped    = 0;

	void Add(DayBatch& batch, const Reading& r);
};

} // namespace clipmeter

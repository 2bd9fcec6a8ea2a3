#include <stdio.h>
#include <math.h>
#include "reconstructor.h"

using namespace std;

namespace clipmeter {

bool AppendReading(Series& series, int offset, int watts, int cadenceSeconds) {
	if (series.size() != 0) {
		Sample prev = series.back();
		int    gap  = offset - prev.Offset;
		if (gap <= 0)
			return false;
		if (gap * 2 > cadenceSeconds * 3) {
			// n intervals of gap/n seconds each. Each synthetic offset is rounded on its own
			// (halves to even), so that every interval is within a second of gap/n.
			long n = (long) nearbyint((double) gap / (double) cadenceSeconds);
			for (long i = 1; i < n; i++) {
				int t = prev.Offset + (int) nearbyint((double) gap * (double) i / (double) n);
				series.push_back(Sample(t, prev.Watts));
			}
		}
	}
	series.push_back(Sample(offset, watts));
	return true;
}

Reconstructor::Reconstructor(TelemetryCursor* cursor) : Cursor(cursor) {
}

void Reconstructor::Add(DayBatch& batch, const Reading& r) {
	Series& series = batch.Devices[r.Device];
	if (!AppendReading(series, r.Time.Seconds, r.Watts, CadenceSeconds)) {
		fprintf(stderr, "%s SN%lld dropping out of order reading at %s (previous at %s)\n",
		        batch.Day.ToString().c_str(), (long long) r.Device, SecondsToTime(r.Time.Seconds).c_str(), SecondsToTime(series.back().Offset).c_str());
		Dropped++;
	}
}

bool Reconstructor::NextDay(DayBatch& batch) {
	batch.Devices.clear();
	if (!HasPending) {
		if (!Cursor->Next(Pending))
			return false;
		HasPending = true;
	}
	batch.Day = Pending.Time.Day;
	Add(batch, Pending);
	while (true) {
		if (!Cursor->Next(Pending)) {
			HasPending = false;
			// Don't hand out a day that may be missing readings
			return Cursor->Status() == StoreResponse::OK;
		}
		if (Pending.Time.Day < batch.Day) {
			// Belongs to a day that was already handed out
			fprintf(stderr, "%s SN%lld dropping out of order reading from %s\n",
			        batch.Day.ToString().c_str(), (long long) Pending.Device, Pending.Time.ToString().c_str());
			Dropped++;
			continue;
		}
		if (Pending.Time.Day != batch.Day) {
			// Date rollover. Pending becomes the first reading of the next day.
			return true;
		}
		Add(batch, Pending);
	}
}

} // namespace clipmeter

#pragma once

#include <stdio.h>
#include <stdint.h>
#include <string>

#include "timeUtils.h"
#include "analyzer.h"

namespace clipmeter {

// The largest value seen so far, and which device-day produced it
struct Extreme {
	int64_t         Ws     = 0;
	int64_t         Device = 0;
	clipmeter::Date Day    = clipmeter::Date(1, 1, 1);

	void Offer(int64_t ws, int64_t device, const clipmeter::Date& day) {
		if (ws > Ws) {
			Ws     = ws;
			Device = device;
			Day    = day;
		}
	}
};

// Report aggregates the results of a run
class Report {
public:
	int     Days             = 0; // Calendar days seen
	int     DeviceDays       = 0; // Device-days aggregated
	int     FailedDeviceDays = 0; // Device-days that could not be analyzed (not aggregated)
	int64_t TotalGeneratedWs = 0;
	int64_t TotalExceedWs    = 0;
	int64_t TotalShavedWs    = 0;
	Extreme MaxGenerated;
	Extreme MaxExceedance;
	Extreme MaxShaved;

	void BeginDay();
	void Add(const DayAnalysis& a);
	void PrintSummary(FILE* f) const;

	double AverageWsPerDay() const;    // Generated energy per calendar day, or 0
	double AverageWsPerDevice() const; // Generated energy per device-day, or 0

	// "<date> SN<device> <gen>Whr generated[, <exc>Whr exceedance][, <shaved>Whr shaved]"
	static std::string FormatDetail(const DayAnalysis& a);
};

// Watt-seconds as watt-hours with 2 decimals
std::string FormatWh(double ws);

} // namespace clipmeter

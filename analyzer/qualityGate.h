#pragma once

#include <string>

#include "types.h"

namespace clipmeter {

// Result of the data quality checks on one device-day
struct GateReport {
	int  NumSamples      = 0;
	int  MinGap          = 0;     // Smallest seconds between samples
	int  MaxGap          = 0;     // Largest seconds between samples
	int  AvgGap          = 0;     // Average seconds between samples
	int  NumAtCeiling    = 0;     // Samples at or above the ceiling
	bool StartupTooHigh  = false; // First sample above MaxStartupW
	bool TooFewSamples   = false; // Fewer than MinSamples
	bool ShutdownTooHigh = false; // Last sample above MaxShutdownW

	bool Passed() const {
		return !StartupTooHigh && !TooFewSamples && !ShutdownTooHigh;
	}

	// The first failed check, or DayStatus::OK
	DayStatus Failure() const;
};

// Run the data quality checks, and log warnings and failures to stderr.
// label is the "<date> SN<device>" prefix of log messages.
// Inconsistent sample spacing is only ever a warning.
GateReport InspectDay(const std::string& label, const Series& series, const AnalysisParams& params, int cadenceSeconds);

// Decide whether the day proceeds to curve fitting. Returns DayStatus::OK to proceed,
// otherwise the reason why the day stops with only its generated energy.
DayStatus GateDay(const GateReport& report, const AnalysisParams& params);

} // namespace clipmeter

#pragma once

#include <stdint.h>
#include <vector>

namespace clipmeter {

// One point of a device's day
struct Sample {
	int Offset = 0; // Seconds past midnight, 0 .. 86399
	int Watts  = 0; // Reported output power

	Sample(int offset = 0, int watts = 0) : Offset(offset), Watts(watts) {}
	bool operator==(const Sample& b) const {
		return Offset == b.Offset && Watts == b.Watts;
	}
	bool operator!=(const Sample& b) const {
		return !(*this == b);
	}
};

// Samples of one device for one day, with strictly increasing offsets
typedef std::vector<Sample> Series;

enum class Strictness {
	Forced, // Analyze every day, even if the data looks suspect
	Gated,  // Only fit curves to days that pass the data quality checks
};

enum class DayStatus {
	OK,
	NoExceedance,         // No sample reached the ceiling, so curve fitting was skipped
	StartupPowerTooHigh,  // First sample too high. We probably missed the start of the day.
	InsufficientData,     // Too few samples
	ShutdownPowerTooHigh, // Last sample too high. We probably missed the end of the day.
	TooCloudy,            // Too few normal samples left after cloud rejection
	FitUndefined,         // A quadratic fit had fewer than 3 points. The day is unusable.
};

const char* StrictnessToString(Strictness v);
const char* DayStatusToString(DayStatus v);
bool        ParseStrictness(const char* s, Strictness& out);

// Parameters of the per-day analysis
struct AnalysisParams {
	int        CeilingW                 = 349;                // Maximum continuous power of the inverters. Output at or above this is assumed to be clipped.
	int        MaxStartupW              = 20;                 // If the first sample of the day is higher than this, we probably missed too much data
	int        MaxShutdownW             = 0;                  // If the last sample of the day is higher than this, we probably missed too much data
	int        MinSamples               = 50;                 // Minimum number of samples in a day
	int        MinFitSamples            = 50;                 // Minimum number of normal samples left after cloud rejection
	int        FitMinW                  = 75;                 // Samples at or below this are not very parabolic, and are not used for fitting
	int        CloudThresholdW          = 5;                  // Samples more than this below the fitted curve are considered shaded by cloud
	Strictness Mode                     = Strictness::Gated;  // What to do with days that fail the quality checks
	bool       SkipFitWithoutExceedance = true;               // Don't fit curves to days where no sample reached the ceiling
};

// Energy figures for one device-day, in watt-seconds.
// The Has* flags are false when the figure was not computed.
struct AnalysisResult {
	int64_t GeneratedWs   = 0;
	bool    HasExceedance = false;
	int64_t ExceedanceWs  = 0;
	bool    HasShaved     = false;
	int64_t ShavedWs      = 0;
};

} // namespace clipmeter

#pragma once

#include <stdint.h>
#include <string>
#include <vector>

#include "types.h"
#include "timeUtils.h"
#include "qualityGate.h"
#include "curveFit.h"
#include "reconstructor.h"

namespace clipmeter {

// Everything we learned about one device-day
struct DayAnalysis {
	clipmeter::Date Day;
	int64_t         Device = 0;
	DayStatus       Status = DayStatus::OK;
	AnalysisResult  Result;
	GateReport      Gate;
	bool            Fitted = false; // True if Fit holds all three curves
	EnvelopeFit     Fit;

	// "<date> SN<device>", the prefix of all log messages about this day
	std::string Label() const;

	// FitUndefined days are excluded from aggregation
	bool Failed() const { return Status == DayStatus::FitUndefined; }
};

std::string DayLabel(const Date& day, int64_t device);

// Analyze one device-day: quality gate, envelope fit, and energy accounting.
// Days that stop early keep their generated energy, but have no exceedance or shaved energy.
DayAnalysis AnalyzeDay(const Date& day, int64_t device, const Series& series, const AnalysisParams& params, int cadenceSeconds);

// Analyze all devices of a day, using up to 'threads' worker threads.
// Results are in device order, regardless of the number of threads.
std::vector<DayAnalysis> AnalyzeBatch(const DayBatch& batch, const AnalysisParams& params, int cadenceSeconds, int threads);

} // namespace clipmeter

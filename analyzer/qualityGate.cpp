#include <stdio.h>
#include <math.h>
#include <algorithm>
#include "qualityGate.h"
#include "timeUtils.h"

using namespace std;

namespace clipmeter {

DayStatus GateReport::Failure() const {
	if (StartupTooHigh)
		return DayStatus::StartupPowerTooHigh;
	if (TooFewSamples)
		return DayStatus::InsufficientData;
	if (ShutdownTooHigh)
		return DayStatus::ShutdownPowerTooHigh;
	return DayStatus::OK;
}

GateReport InspectDay(const std::string& label, const Series& series, const AnalysisParams& params, int cadenceSeconds) {
	GateReport r;
	r.NumSamples = (int) series.size();
	if (series.size() == 0) {
		r.TooFewSamples = true;
		fprintf(stderr, "%s insufficient data for analysis: 0 records\n", label.c_str());
		return r;
	}

	r.MinGap = SecondsPerDay;
	r.MaxGap = 0;
	for (size_t i = 0; i < series.size(); i++) {
		if (series[i].Watts >= params.CeilingW)
			r.NumAtCeiling++;
		if (i != 0) {
			int gap  = series[i].Offset - series[i - 1].Offset;
			r.MinGap = std::min(r.MinGap, gap);
			r.MaxGap = std::max(r.MaxGap, gap);
		}
	}

	if (series.size() > 1) {
		r.AvgGap = (int) lround((double) (series.back().Offset - series.front().Offset) / (double) (series.size() - 1));
		if (r.MaxGap * 2 > r.AvgGap * 3)
			fprintf(stderr, "%s max delta too high: %d secs (avg delta: %d secs)\n", label.c_str(), r.MaxGap, r.AvgGap);
		if (r.MinGap * 2 < r.AvgGap)
			fprintf(stderr, "%s min delta too low: %d secs (avg delta: %d secs)\n", label.c_str(), r.MinGap, r.AvgGap);
	} else {
		r.MinGap = 0;
		r.AvgGap = cadenceSeconds;
	}

	if (series.front().Watts > params.MaxStartupW) {
		r.StartupTooHigh = true;
		fprintf(stderr, "%s startup power too high: %d W\n", label.c_str(), series.front().Watts);
	}
	if (r.NumSamples < params.MinSamples) {
		r.TooFewSamples = true;
		fprintf(stderr, "%s insufficient data for analysis: %d records\n", label.c_str(), r.NumSamples);
	}
	if (series.back().Watts > params.MaxShutdownW) {
		r.ShutdownTooHigh = true;
		fprintf(stderr, "%s shutdown power too high: %d W\n", label.c_str(), series.back().Watts);
	}
	return r;
}

DayStatus GateDay(const GateReport& report, const AnalysisParams& params) {
	if (params.Mode == Strictness::Gated && !report.Passed())
		return report.Failure();
	// If nothing reached the ceiling, then there is nothing to shave, and the fit would only
	// tell us what we already know.
	if (report.NumAtCeiling == 0 && params.SkipFitWithoutExceedance)
		return DayStatus::NoExceedance;
	return DayStatus::OK;
}

} // namespace clipmeter

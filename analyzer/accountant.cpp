#include <math.h>
#include "accountant.h"

using namespace std;

namespace clipmeter {

int64_t DoubledGeneratedEnergy(const Series& series) {
	int64_t doubled = 0;
	for (size_t i = 1; i < series.size(); i++) {
		int64_t dt = series[i].Offset - series[i - 1].Offset;
		doubled += dt * (int64_t) (series[i - 1].Watts + series[i].Watts);
	}
	return doubled;
}

int64_t HalveRounded(int64_t doubled) {
	// Energies are never negative, so we only need to round half up
	return (doubled + 1) / 2;
}

double DoubledIntervalExceedance(double t0, double w0, double t1, double w1, double ceiling) {
	bool high0 = w0 >= ceiling;
	bool high1 = w1 >= ceiling;
	if (!high0 && !high1)
		return 0;
	double dt = t1 - t0;
	if (high0 && high1) {
		// Whole interval is above the ceiling
		return dt * (w0 - ceiling + w1 - ceiling);
	}
	// Crossing. w1 != w0, because exactly one of them is below the ceiling.
	double tCross = t0 + (ceiling - w0) * dt / (w1 - w0);
	if (high1) {
		// becoming over the ceiling
		return (t1 - tCross) * (w1 - ceiling);
	} else {
		// becoming under the ceiling
		return (tCross - t0) * (w0 - ceiling);
	}
}

double DoubledExceedance(const Series& series, const std::vector<double>& watts, double ceiling) {
	double doubled = 0;
	for (size_t i = 1; i < series.size(); i++)
		doubled += DoubledIntervalExceedance(series[i - 1].Offset, watts[i - 1], series[i].Offset, watts[i], ceiling);
	return doubled;
}

std::vector<double> RawWatts(const Series& series) {
	vector<double> w(series.size());
	for (size_t i = 0; i < series.size(); i++)
		w[i] = series[i].Watts;
	return w;
}

std::vector<double> EstimatedWatts(const Series& series, int ceilingW, const FitCurve& fit) {
	vector<double> w(series.size());
	for (size_t i = 0; i < series.size(); i++) {
		if (series[i].Watts < ceilingW)
			w[i] = series[i].Watts;
		else
			w[i] = fit(series[i].Offset);
	}
	return w;
}

AnalysisResult AccountEnergy(const Series& series, int ceilingW, const FitCurve& fit) {
	AnalysisResult r;
	r.GeneratedWs = HalveRounded(DoubledGeneratedEnergy(series));

	bool anyAtCeiling = false;
	for (const auto& s : series) {
		if (s.Watts >= ceilingW) {
			anyAtCeiling = true;
			break;
		}
	}
	if (!anyAtCeiling)
		return r;

	double exceedance    = DoubledExceedance(series, RawWatts(series), ceilingW);
	double estExceedance = DoubledExceedance(series, EstimatedWatts(series, ceilingW, fit), ceilingW);

	r.HasExceedance = true;
	r.ExceedanceWs  = llround(exceedance / 2);
	if (estExceedance > exceedance) {
		r.HasShaved = true;
		r.ShavedWs  = llround((estExceedance - exceedance) / 2);
	}
	return r;
}

} // namespace clipmeter

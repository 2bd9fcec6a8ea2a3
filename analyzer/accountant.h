#pragma once

#include <stdint.h>
#include <vector>

#include "types.h"
#include "curveFit.h"

namespace clipmeter {

// Twice the trapezoidal integral of the series, in watt-seconds.
// Tracking double the energy keeps everything in integers.
int64_t DoubledGeneratedEnergy(const Series& series);

// Halve a doubled energy, rounding to nearest
int64_t HalveRounded(int64_t doubled);

// Twice the area above ceiling between (t0, w0) and (t1, w1), treating the power as
// linear in between. When only one end is at or above the ceiling, we interpolate the
// time at which the ceiling is crossed, and only count the triangle on the high side.
double DoubledIntervalExceedance(double t0, double w0, double t1, double w1, double ceiling);

// Twice the area above ceiling of the series formed by the offsets of 'series' and 'watts'
double DoubledExceedance(const Series& series, const std::vector<double>& watts, double ceiling);

// The raw watts of the series
std::vector<double> RawWatts(const Series& series);

// The watts of the series, with the clipped samples replaced by the fitted curve
std::vector<double> EstimatedWatts(const Series& series, int ceilingW, const FitCurve& fit);

// Compute generated, exceedance, and shaved energy of a day
AnalysisResult AccountEnergy(const Series& series, int ceilingW, const FitCurve& fit);

} // namespace clipmeter

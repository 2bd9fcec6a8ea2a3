#pragma once

#include <string>
#include <vector>

#include "types.h"

namespace clipmeter {

// FitCurve is a quadratic over a day's offsets.
// Like numpy's Polynomial.fit, the offsets are first mapped from the fit domain
// onto [-1, 1], which keeps the least squares problem well conditioned
// (raw offsets squared are around 10^9).
class FitCurve {
public:
	double Coef[3]   = {0, 0, 0}; // c0 + c1*u + c2*u^2, where u is the offset mapped onto [-1, 1]
	double DomainMin = 0;         // Offset that maps to u = -1
	double DomainMax = 1;         // Offset that maps to u = 1

	double MapToUnit(double offset) const;
	double MapFromUnit(double u) const;
	double operator()(double offset) const;

	// Offset and value of the curve's maximum. Returns false if the curve is not concave.
	bool Peak(double& offset, double& watts) const;
};

// Ordinary least squares fit of a quadratic to (x, y).
// Returns false if there are fewer than 3 points, or fewer than 3 distinct x values.
bool FitQuadratic(const std::vector<double>& x, const std::vector<double>& y, FitCurve& out);

enum class SampleClass {
	Low,     // At or below FitMinW. Not used for fitting.
	Clipped, // At or above the ceiling
	Cloudy,  // Shaded by cloud
	Normal,  // Used for the final fit
};

const char* SampleClassToString(SampleClass v);

// The three passes of the envelope fit
struct EnvelopeFit {
	FitCurve          Pass1;               // Fit to all unclipped samples
	FitCurve          Pass2;               // Fit after the first round of cloud rejection
	FitCurve          Final;               // Fit after the second round of cloud rejection
	std::vector<bool> Cloudy1;             // Samples below Pass1 - CloudThresholdW
	std::vector<bool> Cloudy2;             // Samples below Pass2 - CloudThresholdW
	std::vector<bool> CloudyFinal;         // Samples below Final - CloudThresholdW
	int               NumPass1      = 0;   // Points used by each pass
	int               NumPass2      = 0;
	int               NumFinal      = 0;
	bool              TooCloudy     = false; // Fewer than MinFitSamples points left for the final fit, or a pass could not be fitted (Gated)
	bool              HasFinal      = false; // Final is valid
	int               UndefinedPass = 0;     // The pass (1..3) that had fewer than 3 points, or 0
};

// Estimate the unclipped production envelope of a day.
// If the day is too cloudy and params.Mode is Gated, then this returns true, but without
// computing the final curve (HasFinal = false). A pass with fewer than 3 points to fit
// counts as too cloudy in Gated mode. In Forced mode it returns false, and the day
// cannot be analyzed.
bool FitEnvelope(const std::string& label, const Series& series, const AnalysisParams& params, EnvelopeFit& out);

// Classify each sample, for diagnostics
std::vector<SampleClass> ClassifySamples(const Series& series, const std::vector<bool>& cloudy, const AnalysisParams& params);

} // namespace clipmeter

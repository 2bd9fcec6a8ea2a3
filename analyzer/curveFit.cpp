#include <stdio.h>
#include <algorithm>
#include <Eigen/Dense>
#include "curveFit.h"

using namespace std;

namespace clipmeter {

double FitCurve::MapToUnit(double offset) const {
	return (2.0 * offset - (DomainMin + DomainMax)) / (DomainMax - DomainMin);
}

double FitCurve::MapFromUnit(double u) const {
	return (u * (DomainMax - DomainMin) + (DomainMin + DomainMax)) / 2.0;
}

double FitCurve::operator()(double offset) const {
	double u = MapToUnit(offset);
	return Coef[0] + u * (Coef[1] + u * Coef[2]);
}

bool FitCurve::Peak(double& offset, double& watts) const {
	if (Coef[2] >= 0)
		return false;
	double u = -Coef[1] / (2.0 * Coef[2]);
	offset   = MapFromUnit(u);
	watts    = Coef[0] + u * (Coef[1] + u * Coef[2]);
	return true;
}

bool FitQuadratic(const std::vector<double>& x, const std::vector<double>& y, FitCurve& out) {
	if (x.size() != y.size() || x.size() < 3)
		return false;

	double xmin = *std::min_element(x.begin(), x.end());
	double xmax = *std::max_element(x.begin(), x.end());
	if (xmax == xmin)
		return false;

	FitCurve fit;
	fit.DomainMin = xmin;
	fit.DomainMax = xmax;

	// Vandermonde matrix in the mapped variable
	Eigen::Index    n = (Eigen::Index) x.size();
	Eigen::MatrixXd A(n, 3);
	Eigen::VectorXd b(n);
	for (Eigen::Index i = 0; i < n; i++) {
		double u = fit.MapToUnit(x[(size_t) i]);
		A(i, 0)  = 1;
		A(i, 1)  = u;
		A(i, 2)  = u * u;
		b[i]     = y[(size_t) i];
	}

	auto qr = A.colPivHouseholderQr();
	if (qr.rank() < 3)
		return false;
	Eigen::VectorXd c = qr.solve(b);
	for (int i = 0; i < 3; i++)
		fit.Coef[i] = c[i];
	out = fit;
	return true;
}

const char* SampleClassToString(SampleClass v) {
	switch (v) {
	case SampleClass::Low: return "low";
	case SampleClass::Clipped: return "clipped";
	case SampleClass::Cloudy: return "cloudy";
	case SampleClass::Normal: return "normal";
	}
	return "INVALID";
}

// A sample is cloudy if it's in the fitting range, but well below the curve.
// Subtracting a threshold (instead of testing for any point below the curve)
// keeps us from throwing away points that are just fit noise.
static vector<bool> FlagCloudy(const Series& series, const FitCurve& curve, const AnalysisParams& params) {
	vector<bool> cloudy(series.size(), false);
	for (size_t i = 0; i < series.size(); i++) {
		const auto& s = series[i];
		cloudy[i]     = params.FitMinW < s.Watts && s.Watts < curve(s.Offset) - params.CloudThresholdW;
	}
	return cloudy;
}

// Collect the unclipped samples in the fitting range, skipping those flagged in exclude (if not null)
static void Unclipped(const Series& series, const AnalysisParams& params, const vector<bool>* exclude, vector<double>& x, vector<double>& y) {
	x.clear();
	y.clear();
	for (size_t i = 0; i < series.size(); i++) {
		const auto& s = series[i];
		if (s.Watts <= params.FitMinW || s.Watts >= params.CeilingW)
			continue;
		if (exclude != nullptr && (*exclude)[i])
			continue;
		x.push_back(s.Offset);
		y.push_back(s.Watts);
	}
}

static bool FitPass(const std::string& label, int pass, const vector<double>& x, const vector<double>& y, FitCurve& curve, EnvelopeFit& out) {
	if (!FitQuadratic(x, y, curve)) {
		fprintf(stderr, "%s quadratic fit undefined: only %d points (pass %d)\n", label.c_str(), (int) x.size(), pass);
		out.UndefinedPass = pass;
		return false;
	}
	return true;
}

// Called when a pass had too few points to fit. In Gated mode that is just a very cloudy
// day, which keeps its generated energy. In Forced mode the day cannot be analyzed.
static bool FitFailed(const std::string& label, int numPoints, const AnalysisParams& params, EnvelopeFit& out) {
	if (params.Mode == Strictness::Forced)
		return false;
	out.TooCloudy = true;
	fprintf(stderr, "%s too cloudy, only : %d normal data points\n", label.c_str(), numPoints);
	return true;
}

bool FitEnvelope(const std::string& label, const Series& series, const AnalysisParams& params, EnvelopeFit& out) {
	out = EnvelopeFit();
	vector<double> x, y;

	Unclipped(series, params, nullptr, x, y);
	out.NumPass1 = (int) x.size();
	if (!FitPass(label, 1, x, y, out.Pass1, out))
		return FitFailed(label, out.NumPass1, params, out);
	out.Cloudy1 = FlagCloudy(series, out.Pass1, params);

	Unclipped(series, params, &out.Cloudy1, x, y);
	out.NumPass2 = (int) x.size();
	if (!FitPass(label, 2, x, y, out.Pass2, out))
		return FitFailed(label, out.NumPass2, params, out);
	out.Cloudy2 = FlagCloudy(series, out.Pass2, params);

	Unclipped(series, params, &out.Cloudy2, x, y);
	out.NumFinal = (int) x.size();
	if (out.NumFinal < params.MinFitSamples) {
		out.TooCloudy = true;
		fprintf(stderr, "%s too cloudy, only : %d normal data points\n", label.c_str(), out.NumFinal);
		if (params.Mode == Strictness::Gated)
			return true;
	}
	if (!FitPass(label, 3, x, y, out.Final, out))
		return FitFailed(label, out.NumFinal, params, out);
	out.CloudyFinal = FlagCloudy(series, out.Final, params);
	out.HasFinal    = true;
	return true;
}

std::vector<SampleClass> ClassifySamples(const Series& series, const std::vector<bool>& cloudy, const AnalysisParams& params) {
	vector<SampleClass> classes(series.size(), SampleClass::Normal);
	for (size_t i = 0; i < series.size(); i++) {
		if (series[i].Watts <= params.FitMinW)
			classes[i] = SampleClass::Low;
		else if (series[i].Watts >= params.CeilingW)
			classes[i] = SampleClass::Clipped;
		else if (i < cloudy.size() && cloudy[i])
			classes[i] = SampleClass::Cloudy;
	}
	return classes;
}

} // namespace clipmeter
